// =============================================================================
//  Traffic Probe - Tool Server Main
//  文件: tool_server_main.cpp
//  描述: 工具服务进程入口（stdin/stdout承载JSON-RPC）
//  版权: Copyright (c) 2026
// =============================================================================

#include "config/config.hpp"
#include "store/capture_store.hpp"
#include "tool_server/tool_server.hpp"
#include "utils/logger.hpp"
#include <csignal>
#include <cstdio>
#include <getopt.h>
#include <iostream>
#include <string>

using namespace traffic_probe;

namespace {

const char* const MODULE = "Main";

void print_usage(const char* prog) {
    std::fprintf(stderr,
                 "Usage: %s [--config <file>] [--store-dir <dir>] [--log-level <level>]\n"
                 "  --config     JSON configuration file\n"
                 "  --store-dir  capture store directory (overrides config)\n"
                 "  --log-level  DEBUG/INFO/WARN/ERROR (overrides config)\n",
                 prog);
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string store_dir;
    std::string log_level;

    static const struct option long_options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"store-dir", required_argument, nullptr, 's'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:s:l:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 's':
                store_dir = optarg;
                break;
            case 'l':
                log_level = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 2;
        }
    }

    // stdout承载协议数据，日志只能写stderr
    auto& logger = utils::Logger::instance();
    logger.set_console_stream(utils::ConsoleStream::STDERR_ONLY);

    // 步骤1: 加载配置
    config::Config cfg;
    if (!config_path.empty()) {
        auto load_ret = cfg.load_from_file(config_path);
        if (load_ret.is_err()) {
            std::fprintf(stderr, "failed to load config %s: %s\n",
                         config_path.c_str(), load_ret.error_message().c_str());
            return 1;
        }
    }

    // 步骤2: 命令行覆盖
    if (!store_dir.empty()) {
        config::StoreConfig store_cfg = cfg.get_store();
        store_cfg.directory = store_dir;
        cfg.set_store(store_cfg);
    }
    if (!log_level.empty()) {
        config::LoggingConfig logging_cfg = cfg.get_logging();
        logging_cfg.level = log_level;
        cfg.set_logging(logging_cfg);
    }

    auto validate_ret = cfg.validate();
    if (validate_ret.is_err()) {
        std::fprintf(stderr, "invalid configuration: %s\n", validate_ret.error_message().c_str());
        return 1;
    }

    // 步骤3: 初始化日志
    const config::LoggingConfig& logging_cfg = cfg.get_logging();
    if (logger.init(logging_cfg.level, logging_cfg.file) != 0) {
        std::fprintf(stderr, "cannot open log file %s\n", logging_cfg.file.c_str());
        return 1;
    }
    logger.set_console_output(logging_cfg.console_output);

    // 写入失败时由输出流状态处理，不因SIGPIPE退出
    std::signal(SIGPIPE, SIG_IGN);

    // 步骤4: 打开存储并运行
    store::CaptureStore store(cfg.get_store().directory, cfg.get_store().sync_writes);
    auto open_ret = store.open();
    if (open_ret.is_err()) {
        LOG_ERROR(MODULE, "cannot open store: %s", open_ret.error_message().c_str());
        logger.shutdown();
        return 1;
    }

    tool_server::ToolServer server(store, cfg.get_server());
    int ret = server.run(std::cin, std::cout);

    logger.shutdown();
    return ret;
}

// 文件结束
