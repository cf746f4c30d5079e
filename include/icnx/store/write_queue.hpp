// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <icnx/store/sqlite.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace icnx::store {

// Single consumer for one logical store. Producers enqueue jobs without
// waiting; the worker runs them in FIFO order against cached connections,
// creating the schema when a connection is opened. Job failures are logged
// and dropped.
class WriteQueue {
public:
    using Job = std::function<std::error_code(Database&)>;

    WriteQueue(std::string name, std::string schema);

    // Drains pending jobs, then joins the worker
    ~WriteQueue();

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    void enqueue(std::filesystem::path db_path, Job job);

    // Close the cached connection for a database once earlier jobs ran
    void release(std::filesystem::path db_path);

    // Block until every job enqueued before the call has run
    void flush();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    // Jobs that returned an error or could not open their database
    [[nodiscard]] std::uint64_t failures() const;

private:
    struct Task {
        std::filesystem::path db_path;
        Job job;  // empty for a release marker
    };

    void run(std::stop_token stoken);
    void execute(Task& task);
    Database* connection(const std::filesystem::path& db_path);

    const std::string name_;
    const std::string schema_;

    std::deque<Task> queue_;
    std::uint64_t enqueued_{0};
    std::uint64_t completed_{0};
    std::uint64_t failures_{0};
    mutable std::mutex mutex_;
    std::condition_variable_any work_cv_;
    std::condition_variable done_cv_;

    // Touched only by the worker thread
    std::map<std::filesystem::path, std::unique_ptr<Database>> connections_;

    std::jthread worker_;
};

} // namespace icnx::store
