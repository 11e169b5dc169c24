#pragma once

#include <string>
#include <memory>
#include <filesystem>
#include <core/dump_types.hpp>

// Decides where a device's dump lands. Implementations are pure: no
// filesystem access, same inputs give the same path.
class PathNamingStrategy {
public:
    virtual ~PathNamingStrategy() = default;

    virtual std::string name() const = 0;

    virtual std::filesystem::path dump_directory(const std::string& device_id,
                                                 const std::string& timestamp,
                                                 DumpTrigger trigger) const = 0;
};

// {root}/{prefix}/{timestamp}/{device_id}: one folder per incident
class UnifiedPathStrategy : public PathNamingStrategy {
public:
    UnifiedPathStrategy(std::filesystem::path root, std::string prefix);

    std::string name() const override { return "unified"; }
    std::filesystem::path dump_directory(const std::string& device_id,
                                         const std::string& timestamp,
                                         DumpTrigger trigger) const override;

private:
    std::filesystem::path root_;
    std::string prefix_;
};

// {root}/dumps/{device_id}: ad hoc dumps, no grouping
class IndividualPathStrategy : public PathNamingStrategy {
public:
    explicit IndividualPathStrategy(std::filesystem::path root);

    std::string name() const override { return "individual"; }
    std::filesystem::path dump_directory(const std::string& device_id,
                                         const std::string& timestamp,
                                         DumpTrigger trigger) const override;

private:
    std::filesystem::path root_;
};

// Unified for health-check failures, individual for everything else
class HybridPathStrategy : public PathNamingStrategy {
public:
    HybridPathStrategy(std::filesystem::path root, std::string prefix);

    std::string name() const override { return "hybrid"; }
    std::filesystem::path dump_directory(const std::string& device_id,
                                         const std::string& timestamp,
                                         DumpTrigger trigger) const override;

private:
    UnifiedPathStrategy unified_;
    IndividualPathStrategy individual_;
};

// Build a strategy by name. Unknown names fall back to unified (logged).
std::unique_ptr<PathNamingStrategy> make_path_strategy(const std::string& name,
                                                       const std::filesystem::path& root,
                                                       const std::string& prefix);
