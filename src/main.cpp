/**
 * @file main.cpp
 * @brief sandcell - sandboxed execution session manager CLI
 *
 * Each invocation performs one sandbox operation and prints its result on
 * stdout; logs go to stderr. Because every call may be a fresh process,
 * sandboxes are addressed by the id printed by `create`.
 *
 * ```
 * sandcell create
 * sandcell run sc-1a2b3c4d5e6f "echo hello"
 * sandcell exec-code sc-1a2b3c4d5e6f "print(1+1)"
 * sandcell upload sc-1a2b3c4d5e6f ./data.csv --dir /home/sandbox/input
 * sandcell fetch-url sc-1a2b3c4d5e6f https://example.com/file.txt
 * sandcell download sc-1a2b3c4d5e6f /home/sandbox/out.png
 * sandcell kill sc-1a2b3c4d5e6f
 * sandcell sweep
 * ```
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "sandcell/core/config.hpp"
#include "sandcell/core/sandbox_service.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>

using sandcell::core::SandboxService;
using sandcell::core::ServiceConfig;

namespace {

void ConfigureLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("sandcell");
    spdlog::set_default_logger(logger);
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

std::string ReadCode(const std::string& inline_code, const std::string& code_file) {
    if (!code_file.empty()) {
        std::ifstream file(code_file, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot read code file: " + code_file);
        }
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }
    if (inline_code == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    return inline_code;
}

int Emit(const std::string& result) {
    std::cout << result << std::endl;
    return SandboxService::IsError(result) ? 1 : 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{"sandcell - sandboxed execution session manager"};
    app.require_subcommand(1);

    bool verbose = false;
    std::string config_file;
    std::string backend;
    std::string image;
    std::string logs_dir;
    long timeout = 0;
    bool no_network = false;

    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("-c,--config", config_file, "JSON configuration file")
        ->check(CLI::ExistingFile)
        ->envname("SANDCELL_CONFIG");
    app.add_option("--backend", backend, "Sandbox backend (docker or e2b)")
        ->check(CLI::IsMember({"docker", "e2b"}))
        ->envname("SANDBOX_BACKEND");
    app.add_option("--image", image, "Image (docker) or template (e2b) for new sandboxes");
    app.add_option("--timeout", timeout, "Sandbox idle timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->envname("DEFAULT_TIMEOUT");
    app.add_option("--logs-dir", logs_dir, "Directory receiving downloaded files")
        ->envname("LOGS_DIR");
    app.add_flag("--no-network", no_network, "Create sandboxes without network access");

    // Subcommands
    auto* create = app.add_subcommand("create", "Create a sandbox and print its id");

    std::string sandbox_id;
    std::string command;
    auto* run = app.add_subcommand("run", "Run a shell command in a sandbox");
    run->add_option("sandbox_id", sandbox_id, "Sandbox id")->required();
    run->add_option("command", command, "Shell command")->required();

    std::string code;
    std::string code_file;
    auto* exec_code = app.add_subcommand("exec-code", "Run Python code in a sandbox");
    exec_code->add_option("sandbox_id", sandbox_id, "Sandbox id")->required();
    auto* code_opt = exec_code->add_option("code", code, "Python source, or - to read stdin");
    exec_code->add_option("-f,--file", code_file, "Read Python source from a file")
        ->check(CLI::ExistingFile)
        ->excludes(code_opt);

    std::string local_path;
    std::string sandbox_dir;
    auto* upload = app.add_subcommand("upload", "Upload a local file into a sandbox");
    upload->add_option("sandbox_id", sandbox_id, "Sandbox id")->required();
    upload->add_option("local_path", local_path, "Local file")->required();
    upload->add_option("-d,--dir", sandbox_dir, "Destination directory in the sandbox");

    std::string url;
    auto* fetch_url = app.add_subcommand("fetch-url", "Download a URL into a sandbox");
    fetch_url->add_option("sandbox_id", sandbox_id, "Sandbox id")->required();
    fetch_url->add_option("url", url, "URL to download")->required();
    fetch_url->add_option("-d,--dir", sandbox_dir, "Destination directory in the sandbox");

    std::string sandbox_path;
    std::string local_name;
    auto* download = app.add_subcommand("download", "Copy a sandbox file to the logs directory");
    download->add_option("sandbox_id", sandbox_id, "Sandbox id")->required();
    download->add_option("sandbox_path", sandbox_path, "File inside the sandbox")->required();
    download->add_option("-n,--name", local_name, "Local file name");

    auto* kill = app.add_subcommand("kill", "Remove a sandbox");
    kill->add_option("sandbox_id", sandbox_id, "Sandbox id")->required();

    auto* sweep = app.add_subcommand("sweep", "Remove managed sandboxes past their deadline");

    CLI11_PARSE(app, argc, argv);

    ConfigureLogging(verbose);

    try {
        ServiceConfig config = config_file.empty() ? ServiceConfig::FromEnvironment()
                                                   : ServiceConfig::FromJsonFile(config_file);
        if (!backend.empty()) config.backend = sandcell::core::ParseBackendType(backend);
        if (!logs_dir.empty()) config.logs_dir = logs_dir;
        if (timeout > 0) config.default_timeout = std::chrono::seconds(timeout);
        if (no_network) config.network_enabled = false;
        if (!image.empty()) {
            config.image = image;
            config.template_id = image;
        }

        SandboxService service(config);

        if (*create) {
            return Emit(service.CreateSandbox());
        }
        if (*run) {
            return Emit(service.RunCommand(sandbox_id, command));
        }
        if (*exec_code) {
            if (code.empty() && code_file.empty()) {
                spdlog::error("exec-code needs inline code, - for stdin, or --file");
                return 2;
            }
            return Emit(service.RunPythonCode(sandbox_id, ReadCode(code, code_file)));
        }
        if (*upload) {
            return Emit(service.UploadFileFromLocalToSandbox(sandbox_id, local_path, sandbox_dir));
        }
        if (*fetch_url) {
            return Emit(service.DownloadFileFromInternetToSandbox(sandbox_id, url, sandbox_dir));
        }
        if (*download) {
            return Emit(service.DownloadFileFromSandboxToLocal(sandbox_id, sandbox_path, local_name));
        }
        if (*kill) {
            return Emit(service.KillSandbox(sandbox_id));
        }
        if (*sweep) {
            return Emit(service.Sweep());
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
