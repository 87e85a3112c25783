// output_parser.h - Marker protocol interpretation
#pragma once

#include "api_export.h"
#include <optional>
#include <string>
#include <vector>

namespace scriptbox {

struct SCRIPTBOX_API ParsedOutcome {
    std::vector<std::string> created_entities;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool completion_signal_seen = false;

    // exit_code == 0 && completion_signal_seen && errors.empty()
    bool success = false;
};

class SCRIPTBOX_API OutputParser {
public:
    OutputParser();
    explicit OutputParser(std::vector<std::string> benign_stderr_prefixes);

    // A missing exit code (in-process mode) is passed as the caller's synthetic code
    ParsedOutcome Parse(const std::string& stdout_text,
                        const std::string& stderr_text,
                        int exit_code) const;

    static std::vector<std::string> DefaultBenignPrefixes();

    const std::vector<std::string>& GetBenignPrefixes() const { return benign_prefixes_; }

private:
    bool IsBenign(const std::string& line) const;

    std::vector<std::string> benign_prefixes_;
};

} // namespace scriptbox
