//
//  script_encoder.hpp
//  CutPlan
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "export_session.hpp"

namespace cutplan {

/**
 * @brief Encoder that stages an export on disk instead of running it.
 *
 * Text artifacts are written into `dir`; every step becomes one quoted command line of a
 * POSIX shell script (`export.sh` by default) that performs the export when run from `dir`.
 */
class ScriptEncoder : public Encoder {
public:
    explicit ScriptEncoder(std::filesystem::path dir, std::string program = "ffmpeg");

    void write_text_file(const std::string &name, const std::string &contents) override;
    void run_step(const EncodeStep &step) override;

    // Write the collected command lines. Throws std::runtime_error on I/O failure.
    std::filesystem::path write_script(const std::string &name = "export.sh") const;

    const std::vector<std::string> &commands() const { return commands_; }

private:
    std::filesystem::path dir_;
    std::string program_;
    std::vector<std::string> commands_;
};

// Single-quote `arg` for a POSIX shell.
std::string shell_quote(const std::string &arg);

}  // namespace cutplan
