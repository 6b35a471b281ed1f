#pragma once

// Chinese string table - included by i18n.hpp after Strings is defined

inline constexpr Strings ZH_STRINGS_DEF = {
    // General
    "Image Tea 安装程序",
    "确认",
    "确定执行此操作？",
    "确认次数",
    "[Y] 是   [N] 否   [Esc] 取消",

    // Welcome
    "欢迎",
    "Image Tea 尚未安装。",
    "Image Tea 未安装。",
    "应用",
    "仓库",
    "安装包",
    "目标目录",
    "最新版本",
    "正在开始安装...",
    "[I] 安装   [X] 退出",

    // Install / reinstall
    "安装中",
    "重新安装中",
    "重新下载安装包并替换已安装的文件？",
    "正在下载安装包...",
    "正在解压文件...",
    "安装完成。",
    "重新安装完成。",
    "安装失败",

    // Main menu
    "主菜单",
    "安装位置",
    "[L] 启动",
    "[R] 重新安装",
    "[U] 卸载",
    "[X] 退出",
    "请按键选择",

    // Launch
    "应用已启动",
    "启动失败",
    "应用未安装",

    // Uninstall
    "卸载",
    "删除已安装的应用及其全部文件？",
    "正在删除文件...",
    "应用已删除。",
    "卸载失败",
    "已取消卸载。",

    // Failure
    "错误",
    "[R] 重试   [X] 退出",

    // Errors
    "网络不可用",
    "服务器返回 HTTP",
    "无法写入文件",
    "压缩包已损坏",
    "磁盘已满",
    "权限不足",
};
