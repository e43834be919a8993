/// @file byte_source.hpp
/// @brief Byte acquisition for sound sources

#pragma once

#include "fwd.hpp"

#include <tonic/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tonic_sound {

// =============================================================================
// Byte Source Interface
// =============================================================================

/// Resolves a locator to encoded bytes. Results are delivered on the control
/// thread through the task queue, never from inside fetch().
class IByteSource {
public:
    using Bytes = std::vector<std::uint8_t>;
    using FetchCallback = std::function<void(tonic_core::Result<Bytes>)>;

    virtual ~IByteSource() = default;

    virtual void fetch(const std::string& locator, FetchCallback callback) = 0;
};

// =============================================================================
// File Byte Source
// =============================================================================

/// Reads files on the queue's worker; relative locators resolve against root
class FileByteSource : public IByteSource {
public:
    explicit FileByteSource(TaskQueue& tasks, std::filesystem::path root = {});

    void fetch(const std::string& locator, FetchCallback callback) override;

    [[nodiscard]] const std::filesystem::path& root() const { return m_root; }

    /// Synchronous read used by the worker
    static tonic_core::Result<Bytes> read_file(const std::filesystem::path& path);

private:
    TaskQueue& m_tasks;
    std::filesystem::path m_root;
};

// =============================================================================
// Memory Byte Source
// =============================================================================

/// Serves bytes registered under a locator
class MemoryByteSource : public IByteSource {
public:
    explicit MemoryByteSource(TaskQueue& tasks);

    void insert(const std::string& locator, Bytes bytes);
    bool erase(const std::string& locator);
    [[nodiscard]] bool contains(const std::string& locator) const;

    void fetch(const std::string& locator, FetchCallback callback) override;

    /// Number of fetch() calls so far
    [[nodiscard]] std::size_t fetch_count() const { return m_fetches; }

private:
    TaskQueue& m_tasks;
    std::map<std::string, Bytes> m_entries;
    std::size_t m_fetches = 0;
};

} // namespace tonic_sound
