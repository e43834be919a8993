/// @file byte_source.cpp
/// @brief File and in-memory byte sources

#include <tonic/sound/byte_source.hpp>
#include <tonic/sound/task_queue.hpp>

#include <fstream>

namespace tonic_sound {

// =============================================================================
// FileByteSource
// =============================================================================

FileByteSource::FileByteSource(TaskQueue& tasks, std::filesystem::path root)
    : m_tasks(tasks)
    , m_root(std::move(root)) {}

tonic_core::Result<IByteSource::Bytes> FileByteSource::read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return tonic_core::Err<Bytes>(tonic_core::LoadError::io_failed(path.string(), "cannot open file"));
    }

    auto size = file.tellg();
    if (size < 0) {
        return tonic_core::Err<Bytes>(tonic_core::LoadError::io_failed(path.string(), "cannot determine size"));
    }
    file.seekg(0, std::ios::beg);

    Bytes data(static_cast<std::size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return tonic_core::Err<Bytes>(tonic_core::LoadError::io_failed(path.string(), "short read"));
    }

    return tonic_core::Ok(std::move(data));
}

void FileByteSource::fetch(const std::string& locator, FetchCallback callback) {
    std::filesystem::path path(locator);
    if (path.is_relative() && !m_root.empty()) {
        path = m_root / path;
    }

    m_tasks.run_async([path, callback = std::move(callback)]() -> TaskQueue::Completion {
        auto result = read_file(path);
        return [callback, result = std::move(result)]() mutable {
            if (callback) {
                callback(std::move(result));
            }
        };
    });
}

// =============================================================================
// MemoryByteSource
// =============================================================================

MemoryByteSource::MemoryByteSource(TaskQueue& tasks)
    : m_tasks(tasks) {}

void MemoryByteSource::insert(const std::string& locator, Bytes bytes) {
    m_entries[locator] = std::move(bytes);
}

bool MemoryByteSource::erase(const std::string& locator) {
    return m_entries.erase(locator) > 0;
}

bool MemoryByteSource::contains(const std::string& locator) const {
    return m_entries.find(locator) != m_entries.end();
}

void MemoryByteSource::fetch(const std::string& locator, FetchCallback callback) {
    ++m_fetches;

    auto it = m_entries.find(locator);
    tonic_core::Result<Bytes> result = it != m_entries.end()
        ? tonic_core::Ok(it->second)
        : tonic_core::Err<Bytes>(tonic_core::LoadError::io_failed(locator, "no such entry"));

    m_tasks.post([callback = std::move(callback), result = std::move(result)]() mutable {
        if (callback) {
            callback(std::move(result));
        }
    });
}

} // namespace tonic_sound
