//
//  script_encoder.cpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "script_encoder.hpp"

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "logging.hpp"

namespace cutplan {

namespace {

void write_file(const std::filesystem::path &path, const std::string &contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("open failed for " + path.string() + " (" +
                                 std::generic_category().message(errno) + ")");
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out.good()) {
        throw std::runtime_error("write failed for " + path.string());
    }
}

}  // namespace

ScriptEncoder::ScriptEncoder(std::filesystem::path dir, std::string program)
    : dir_(std::move(dir)), program_(std::move(program)) {}

void ScriptEncoder::write_text_file(const std::string &name, const std::string &contents) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("cannot create " + dir_.string() + ": " + ec.message());
    }
    write_file(dir_ / name, contents);
    CP_LOG("io", "wrote " << (dir_ / name).string() << " (" << contents.size() << " bytes)");
}

void ScriptEncoder::run_step(const EncodeStep &step) {
    std::string line = shell_quote(program_);
    for (const auto &arg : step.args) {
        line += ' ';
        line += shell_quote(arg);
    }
    commands_.push_back(std::move(line));
}

std::filesystem::path ScriptEncoder::write_script(const std::string &name) const {
    std::string script = "#!/bin/sh\nset -e\n";
    for (const auto &c : commands_) {
        script += c;
        script += '\n';
    }
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("cannot create " + dir_.string() + ": " + ec.message());
    }
    const auto path = dir_ / name;
    write_file(path, script);
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_exec |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::add, ec);
    if (ec) {
        CP_LOG("warn", "could not mark " << path.string() << " executable: " << ec.message());
    }
    return path;
}

std::string shell_quote(const std::string &arg) {
    if (!arg.empty() && arg.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                              "0123456789_-+.,/:=@") == std::string::npos) {
        return arg;
    }
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

}  // namespace cutplan
