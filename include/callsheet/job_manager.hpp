#pragma once

#include "config.hpp"
#include "knowledge.hpp"
#include "log.hpp"
#include "types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace callsheet {

    using namespace std::string_view_literals;

    enum class job_status : uint8_t { pending, processing, completed, failed, cancelled };

    inline constexpr std::string_view to_string(job_status status) {
        switch (status) {
            case job_status::pending:
                return "pending"sv;
            case job_status::processing:
                return "processing"sv;
            case job_status::completed:
                return "completed"sv;
            case job_status::failed:
                return "failed"sv;
            case job_status::cancelled:
                return "cancelled"sv;
        }
        return "pending"sv;
    }

    inline constexpr bool is_terminal(job_status status) {
        return status == job_status::completed || status == job_status::failed || status == job_status::cancelled;
    }

    // pending -> processing|cancelled, processing -> completed|failed|cancelled
    inline constexpr bool is_valid_transition(job_status from, job_status to) {
        switch (from) {
            case job_status::pending:
                return to == job_status::processing || to == job_status::cancelled;
            case job_status::processing:
                return is_terminal(to);
            default:
                return false;
        }
    }

    struct analysis_request {
        std::string text{};
        analysis_component component{analysis_component::full_analysis};
        job_priority priority{job_priority::normal};
        bool cache_opt_in{true};
        // Part of the cache key only; the lexical analyzers produce no confidence scores.
        double confidence_threshold{0.5};
    };

    using job_clock = std::chrono::steady_clock;

    struct analysis_job {
        std::string id{};
        job_status status{job_status::pending};
        job_priority priority{job_priority::normal};
        analysis_component component{analysis_component::full_analysis};
        std::string cache_key{};
        bool cache_opt_in{true};
        bool cache_hit{false};
        job_clock::time_point created_at{};
        std::optional<job_clock::time_point> started_at{};
        std::optional<job_clock::time_point> finished_at{};
        std::shared_ptr<const breakdown_run> result{};
        std::optional<std::string> error{};
    };

    struct job_status_info {
        job_status status{job_status::pending};
        // 1-based; set only while the job is queued
        std::optional<std::size_t> queue_position{};
    };

    struct job_result {
        job_status status{job_status::pending};
        bool cache_hit{false};
        std::shared_ptr<const breakdown_run> result{};
        std::optional<std::string> error{};
    };

    struct job_stats {
        std::size_t pending{};
        std::size_t processing{};
        std::size_t completed{};
        std::size_t failed{};
        std::size_t cancelled{};
        std::size_t queue_length{};
        std::size_t cache_entries{};
        std::size_t cache_hits{};
    };

    std::string make_cache_key(const analysis_request& request);

    /*
     * Priority-ordered, bounded-concurrency job runner with a content-hash result cache.
     *
     * Jobs move through an explicit state machine; `transition` is the only place a status changes.
     * Worker threads exist only between start() and stop(); without them the queue can be driven by hand
     * through dequeue_next() and transition().
     */
    class job_manager {
      public:
        using clock_fn = std::function<job_clock::time_point()>;
        using runner_fn = std::function<breakdown_run(const analysis_request&)>;

        // Runs requests through a scene parser built with the component's analyzer set.
        job_manager(pipeline_config cfg, logger log, const knowledge_base& knowledge);
        job_manager(pipeline_config cfg, logger log, runner_fn runner, clock_fn clock = {});
        ~job_manager();

        job_manager(const job_manager&) = delete;
        job_manager& operator=(const job_manager&) = delete;

        std::string submit(analysis_request request);

        // Head of the queue if a processing slot is free; drops stale ids on the way.
        std::optional<std::string> dequeue_next();

        // Throws job_not_found_error or invalid_transition_error.
        void transition(std::string_view job_id, job_status status);

        job_status_info get_status(std::string_view job_id) const;
        job_result get_result(std::string_view job_id) const;
        analysis_job get_job(std::string_view job_id) const;

        // True only when the job was pending.
        bool cancel(std::string_view job_id);

        // Blocks until the job is terminal or `timeout` elapses; returns the status seen last.
        job_status wait(std::string_view job_id, std::chrono::milliseconds timeout);

        void start();
        void stop();
        bool running() const;

        job_stats stats() const;
        std::size_t clear_expired_cache();

        const pipeline_config& config() const { return cfg_; }

      private:
        struct cache_entry {
            std::shared_ptr<const breakdown_run> result{};
            job_clock::time_point cached_at{};
        };

        struct queued_job {
            analysis_job job{};
            analysis_request request{};
        };

        queued_job& find_locked(std::string_view job_id);
        const queued_job& find_locked(std::string_view job_id) const;
        void transition_locked(queued_job& entry, job_status status);
        std::optional<std::string> dequeue_locked();
        void enqueue_locked(const std::string& job_id, job_priority priority);
        bool cache_fresh_locked(const std::string& key) const;

        void worker_loop();
        void finish(const std::string& job_id, std::shared_ptr<const breakdown_run> result, std::optional<std::string> error);

        pipeline_config cfg_;
        logger log_;
        runner_fn runner_;
        clock_fn clock_;

        mutable std::mutex mutex_;
        std::condition_variable work_cv_;
        std::condition_variable done_cv_;

        std::map<std::string, queued_job, std::less<>> jobs_{};
        std::deque<std::string> queue_{};
        std::map<std::string, cache_entry> cache_{};
        std::array<std::size_t, 5> counts_{};
        std::size_t cache_hits_{};
        uint64_t next_id_{1};

        std::vector<std::thread> workers_{};
        std::atomic<bool> shutdown_{false};
    };

}  // namespace callsheet
