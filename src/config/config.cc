#include "config.hpp"

#include "util/log.hpp"
#include "util/readlines.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <sago/platform_folders.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

using json = nlohmann::json;
using namespace diffreview;

namespace {

enum class ConfigVariableType {
    Bool,
    Int,
    String,
};

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

constexpr std::size_t kMaxConfigBytes = 1024 * 1024;

std::vector<std::string>
split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto dot = path.find('.', start);
        parts.push_back(path.substr(start, dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return parts;
}

// The value at a dotted path, or nullptr when any part of it is missing.
const json*
lookup_value_by_path(const json& config, const std::string& path) {
    const json* node = &config;
    for (const auto& key : split_path(path)) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(key);
        if (it == node->end()) {
            return nullptr;
        }
        node = &*it;
    }
    return node;
}

// Store `value` at a dotted path, creating tables on the way. Gives up when a
// non-table is in the way.
bool
set_value_at(json& config, const std::string& path, json value) {
    json* node = &config;
    for (const auto& key : split_path(path)) {
        if (node->is_null()) {
            *node = json::object();
        }
        if (!node->is_object()) {
            return false;
        }
        node = &(*node)[key];
    }
    *node = std::move(value);
    return true;
}

ConfigLoadResult
config_load_file(const std::string& config_path, json& config) {
    std::string text;
    switch (read_file(config_path, kMaxConfigBytes, text)) {
        case ReadStatus::kOk:
            break;
        case ReadStatus::kCannotOpen:
            return ConfigLoadResult::DoesNotExist;
        default:
            return ConfigLoadResult::Invalid;
    }

    config = json::parse(text, nullptr, false);
    if (config.is_discarded() || !config.is_object()) {
        config = json::object();
        return ConfigLoadResult::Invalid;
    }
    return ConfigLoadResult::Ok;
}

void
config_save(const std::string& config_path, const json& config) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(config_path).parent_path(), ec);
    if (ec) {
        log_warning("failed to create config directory for '{}': {}", config_path, ec.message());
        return;
    }

    ec = write_file(config_path, config.dump(4) + "\n");
    if (ec) {
        log_warning("failed to write '{}': {}", config_path, ec.message());
    }
}

void
config_sync_options(json& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        // Stored value wins when it has the right type.
        if (const json* stored_value = lookup_value_by_path(config, path); stored_value) {
            bool applied = false;
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (stored_value->is_boolean()) {
                        *((bool*) ptr) = stored_value->get<bool>();
                        applied = true;
                    }
                } break;
                case ConfigVariableType::Int: {
                    if (stored_value->is_number_integer() && stored_value->get<int64_t>() >= 0) {
                        *((int64_t*) ptr) = stored_value->get<int64_t>();
                        applied = true;
                    }
                } break;
                case ConfigVariableType::String: {
                    if (stored_value->is_string()) {
                        *((std::string*) ptr) = stored_value->get<std::string>();
                        applied = true;
                    }
                } break;
            }
            if (!applied) {
                log_warning("ignoring invalid value for '{}' in config: {}", path, stored_value->dump());
            }
            continue;
        }

        // Otherwise the default from the struct goes into the config.
        bool stored = false;
        switch (type) {
            case ConfigVariableType::Bool: {
                stored = set_value_at(config, path, *(bool*) ptr);
            } break;
            case ConfigVariableType::Int: {
                stored = set_value_at(config, path, *(int64_t*) ptr);
            } break;
            case ConfigVariableType::String: {
                stored = set_value_at(config, path, *(std::string*) ptr);
            } break;
        }
        if (!stored) {
            log_warning("config entry '{}' is shadowed by a non-table value", path);
        }
    }
}

}  // namespace

std::string
diffreview::config_get_directory() {
    return fmt::format("{}/diffreview", sago::getConfigHome());
}

ConfigLoadResult
diffreview::config_apply_file(const std::string& config_path, ProgramOptions& program_options) {
    json config = json::object();
    const auto result = config_load_file(config_path, config);
    switch (result) {
        case ConfigLoadResult::Ok: {
            log_debug("loaded config '{}'", config_path);
        } break;
        case ConfigLoadResult::Invalid: {
            log_error("failed to parse config '{}', using defaults", config_path);
        } break;
        case ConfigLoadResult::DoesNotExist: {
            log_info("could not find config, creating file: {}", config_path);
        } break;
    }

    // clang-format off
    const OptionVector options = {
        { "general.tab_width",            ConfigVariableType::Int,    &program_options.tab_width },
        { "general.context_lines",        ConfigVariableType::Int,    &program_options.context_lines },
        { "general.max_diff_bytes",       ConfigVariableType::Int,    &program_options.max_diff_bytes },
        { "general.max_untracked_bytes",  ConfigVariableType::Int,    &program_options.max_untracked_bytes },
        { "general.binary_check_bytes",   ConfigVariableType::Int,    &program_options.binary_check_bytes },
        { "layout.row_height",            ConfigVariableType::Int,    &program_options.row_height },
        { "layout.comment_line_height",   ConfigVariableType::Int,    &program_options.comment_line_height },
        { "layout.comment_padding",       ConfigVariableType::Int,    &program_options.comment_padding },
        { "layout.comment_button_height", ConfigVariableType::Int,    &program_options.comment_button_height },
        { "agent.command",                ConfigVariableType::String, &program_options.agent_command },
    };
    // clang-format on

    config_sync_options(config, options);

    // Write the configuration to disk with default settings
    if (result == ConfigLoadResult::DoesNotExist) {
        config_save(config_path, config);
    }
    return result;
}

void
diffreview::config_apply_options(ProgramOptions& program_options) {
    const std::string config_path = fmt::format("{}/diffreview.json", config_get_directory());
    config_apply_file(config_path, program_options);
}
