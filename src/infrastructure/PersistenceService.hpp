/**
 * @file PersistenceService.hpp
 * @brief Serialized, atomic file writes for structure documents.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace treeshaper::infrastructure {

/**
 * @struct SaveTask
 * @brief A single file write.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Owns a background thread that performs queued atomic writes in order.
 *
 * All writes, queued or immediate, go through temp file + rename so a reader
 * never sees a half-written document.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues @p content to be written to @p filename.
     * Later calls for the same file win.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Waits for queued writes, then writes on the calling thread.
     * @return True if the file was replaced.
     */
    bool saveText(const std::string& filename, const std::string& content);

    /** @brief Blocks until the queue is empty and no write is in flight. */
    void flush();

    /** @brief Processes the remaining queue and joins the worker. */
    void stop();

private:
    void workerLoop();

    /** @brief temp -> rename. */
    bool performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_writing = false;
    bool m_workerDone = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace treeshaper::infrastructure
