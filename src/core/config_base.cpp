#include "trade_sim/core/config_base.hpp"
#include <iomanip>
#include <stdexcept>

namespace trade_sim {

void ConfigBase::validate(std::vector<std::string>&) const {}

std::vector<std::string> ConfigBase::collect_violations() const {
    std::vector<std::string> violations;
    validate(violations);
    return violations;
}

Result<void> ConfigBase::check(const std::string& component) const {
    auto violations = collect_violations();
    if (!violations.empty()) {
        return make_validation_error<void>(std::move(violations), component);
    }
    return Result<void>();
}

Result<void> ConfigBase::save_to_file(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + filepath, "ConfigBase");
    }
    try {
        file << std::setw(4) << to_json() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Error serializing config: ") + e.what(), "ConfigBase");
    }
    if (!file) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write config: " + filepath,
                                "ConfigBase");
    }
    return Result<void>();
}

Result<void> ConfigBase::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Failed to open file for reading: " + filepath, "ConfigBase");
    }
    try {
        nlohmann::json j;
        file >> j;
        from_json(j);
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error parsing config " + filepath + ": ") + e.what(),
                                "ConfigBase");
    } catch (const std::invalid_argument& e) {
        return make_error<void>(ErrorCode::INVALID_CONFIGURATION,
                                std::string("Invalid value in config " + filepath + ": ") + e.what(),
                                "ConfigBase");
    }
    return check("ConfigBase");
}

}  // namespace trade_sim
