// Copyright (c) 2026 changcheng967. All rights reserved.

#include <icnx/store/write_queue.hpp>
#include <icnx/log.hpp>

namespace icnx::store {

WriteQueue::WriteQueue(std::string name, std::string schema)
    : name_(std::move(name))
    , schema_(std::move(schema))
    , worker_([this](std::stop_token stoken) { run(std::move(stoken)); }) {}

WriteQueue::~WriteQueue() {
    worker_.request_stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void WriteQueue::enqueue(std::filesystem::path db_path, Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(Task{std::move(db_path), std::move(job)});
        ++enqueued_;
    }
    work_cv_.notify_one();
}

void WriteQueue::release(std::filesystem::path db_path) {
    enqueue(std::move(db_path), Job{});
}

void WriteQueue::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto target = enqueued_;
    done_cv_.wait(lock, [&] { return completed_ >= target; });
}

std::uint64_t WriteQueue::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

void WriteQueue::run(std::stop_token stoken) {
    logger()->debug("{} writer started", name_);
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, stoken, [this] { return !queue_.empty(); });
            // Stop only once the queue is drained
            if (queue_.empty()) {
                break;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        execute(task);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++completed_;
        }
        done_cv_.notify_all();
    }
    connections_.clear();
    logger()->debug("{} writer stopped", name_);
}

void WriteQueue::execute(Task& task) {
    if (!task.job) {
        connections_.erase(task.db_path);
        return;
    }

    std::error_code ec;
    if (auto* db = connection(task.db_path)) {
        ec = task.job(*db);
    } else {
        ec = make_error_code(StoreErrc::open_failed);
    }

    if (ec) {
        logger()->warn("{} write to {} failed: {}", name_, task.db_path.string(), ec.message());
        std::lock_guard<std::mutex> lock(mutex_);
        ++failures_;
    }
}

Database* WriteQueue::connection(const std::filesystem::path& db_path) {
    auto it = connections_.find(db_path);
    if (it != connections_.end()) {
        return it->second.get();
    }

    auto db = Database::open(db_path);
    if (!db) {
        return nullptr;
    }
    if (db->exec(schema_)) {
        return nullptr;
    }

    auto inserted = connections_.emplace(db_path, std::make_unique<Database>(std::move(*db)));
    return inserted.first->second.get();
}

} // namespace icnx::store
