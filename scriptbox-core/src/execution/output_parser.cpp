#include "scriptbox/output_parser.h"
#include "scriptbox/marker_protocol.h"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cstring>
#include <sstream>

namespace scriptbox {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool StartsWith(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string AfterMarker(const std::string& line, const char* marker) {
    return Trim(line.substr(std::strlen(marker)));
}

// "Box001 (Part::Box)" -> "Box001"
std::string EntityName(const std::string& payload) {
    if (!payload.empty() && payload.back() == ')') {
        auto open = payload.rfind(" (");
        if (open != std::string::npos) {
            return Trim(payload.substr(0, open));
        }
    }
    return payload;
}

} // anonymous namespace

OutputParser::OutputParser()
    : benign_prefixes_(DefaultBenignPrefixes())
{
}

OutputParser::OutputParser(std::vector<std::string> benign_stderr_prefixes)
    : benign_prefixes_(std::move(benign_stderr_prefixes))
{
}

std::vector<std::string> OutputParser::DefaultBenignPrefixes() {
    // Framework noise printed by FreeCAD's Qt stack on headless hosts
    return {"Qt", "QStandardPaths", "libEGL", "Xlib:"};
}

bool OutputParser::IsBenign(const std::string& line) const {
    for (const auto& prefix : benign_prefixes_) {
        if (!prefix.empty() && line.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

ParsedOutcome OutputParser::Parse(const std::string& stdout_text,
                                  const std::string& stderr_text,
                                  int exit_code) const {
    ParsedOutcome outcome;

    std::istringstream out(stdout_text);
    std::string raw;
    while (std::getline(out, raw)) {
        std::string line = Trim(raw);
        if (line.empty()) {
            continue;
        }

        if (StartsWith(line, markers::kEntityCreated)) {
            std::string name = EntityName(AfterMarker(line, markers::kEntityCreated));
            if (!name.empty()) {
                outcome.created_entities.push_back(name);
            }
        } else if (StartsWith(line, markers::kError)) {
            outcome.errors.push_back(AfterMarker(line, markers::kError));
        } else if (StartsWith(line, markers::kWarning)) {
            outcome.warnings.push_back(AfterMarker(line, markers::kWarning));
        } else if (line == markers::kCompletion) {
            outcome.completion_signal_seen = true;
        }
    }

    std::istringstream err(stderr_text);
    while (std::getline(err, raw)) {
        std::string line = Trim(raw);
        if (line.empty() || IsBenign(line)) {
            continue;
        }
        outcome.errors.push_back(line);
    }

    if (exit_code != 0 && outcome.errors.empty()) {
        outcome.errors.push_back(fmt::format("Process exited with code {}", exit_code));
    }

    // Exiting 0 without the completion marker fails closed
    if (exit_code == 0 && !outcome.completion_signal_seen) {
        outcome.errors.push_back(fmt::format("Completion marker {} not emitted", markers::kCompletion));
    }

    outcome.success = exit_code == 0 && outcome.completion_signal_seen && outcome.errors.empty();

    spdlog::debug("OutputParser: {} entities, {} errors, {} warnings, completion={}",
                  outcome.created_entities.size(), outcome.errors.size(),
                  outcome.warnings.size(), outcome.completion_signal_seen);
    return outcome;
}

} // namespace scriptbox
