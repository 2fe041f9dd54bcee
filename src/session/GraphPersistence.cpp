#include "mindgraph/session/GraphPersistence.h"
#include "mindgraph/common/Logger.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace mindgraph {

FileGraphPersistence::FileGraphPersistence(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileGraphPersistence::pathFor(const std::string& boardId) const {
    return directory_ / (boardId + ".json");
}

void FileGraphPersistence::save(const std::string& boardId, const std::string& json) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + directory_.string() + ": " + ec.message());
    }

    auto path = pathFor(boardId);
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    file << json;
    if (!file.good()) {
        throw std::runtime_error("Write to " + path.string() + " failed");
    }
    LOG_DEBUG("Saved board '{}' to {}", boardId, path.string());
}

std::optional<std::string> FileGraphPersistence::load(const std::string& boardId) {
    std::ifstream file(pathFor(boardId));
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace mindgraph
