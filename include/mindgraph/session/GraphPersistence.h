#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace mindgraph {

/// Storage for serialized board documents.
/// Implementations may throw from save(); the session logs and carries on.
class IGraphPersistence {
public:
    virtual ~IGraphPersistence() = default;

    virtual void save(const std::string& boardId, const std::string& json) = 0;

    /// nullopt when nothing is stored for the board
    virtual std::optional<std::string> load(const std::string& boardId) = 0;
};

/// One `<boardId>.json` file per board inside a directory
class FileGraphPersistence : public IGraphPersistence {
public:
    explicit FileGraphPersistence(std::filesystem::path directory);

    /// Throws std::runtime_error if the file cannot be written
    void save(const std::string& boardId, const std::string& json) override;
    std::optional<std::string> load(const std::string& boardId) override;

    std::filesystem::path pathFor(const std::string& boardId) const;

private:
    std::filesystem::path directory_;
};

}  // namespace mindgraph
