#include "callsheet/job_manager.hpp"

#include "callsheet/analyzers.hpp"
#include "callsheet/errors.hpp"
#include "callsheet/format.hpp"
#include "callsheet/scene_parser.hpp"

#include <algorithm>
#include <exception>

namespace callsheet {

    using namespace callsheet::literals;

    namespace detail {

        static std::size_t status_index(job_status status) { return static_cast<std::size_t>(status); }

    }  // namespace detail

    std::string make_cache_key(const analysis_request& request) {
        return utils::hash_hex("{}\x1f{}\x1f{:.3f}"_format(request.text, request.component, request.confidence_threshold));
    }

    job_manager::job_manager(pipeline_config cfg, logger log, const knowledge_base& knowledge)
        : job_manager{cfg, log, [cfg, log, &knowledge](const analysis_request& request) {
                          scene_parser parser{
                                  cfg, log, knowledge, analyzer_registry::for_component(request.component, cfg)};
                          return parser.analyze_document(request.text);
                      }} {}

    job_manager::job_manager(pipeline_config cfg, logger log, runner_fn runner, clock_fn clock)
        : cfg_{cfg}, log_{std::move(log)}, runner_{std::move(runner)}, clock_{std::move(clock)} {
        if (!clock_) {
            clock_ = [] { return job_clock::now(); };
        }
        if (cfg_.max_concurrent_jobs == 0) {
            cfg_.max_concurrent_jobs = 1;
        }
    }

    job_manager::~job_manager() { stop(); }

    std::string job_manager::submit(analysis_request request) {
        std::string id{};
        {
            std::lock_guard lock{mutex_};
            id = "job-{}"_format(next_id_++);

            queued_job entry{};
            entry.job.id = id;
            entry.job.priority = request.priority;
            entry.job.component = request.component;
            entry.job.cache_key = make_cache_key(request);
            entry.job.cache_opt_in = request.cache_opt_in;
            entry.job.created_at = clock_();

            if (request.cache_opt_in && cache_fresh_locked(entry.job.cache_key)) {
                entry.job.status = job_status::completed;
                entry.job.cache_hit = true;
                entry.job.started_at = entry.job.created_at;
                entry.job.finished_at = entry.job.created_at;
                entry.job.result = cache_.at(entry.job.cache_key).result;
                ++counts_[detail::status_index(job_status::completed)];
                ++cache_hits_;
                jobs_.emplace(id, std::move(entry));
                log_.debug("{} served from cache"_format(id));
                done_cv_.notify_all();
                return id;
            }

            entry.request = std::move(request);
            auto priority = entry.job.priority;
            jobs_.emplace(id, std::move(entry));
            ++counts_[detail::status_index(job_status::pending)];
            enqueue_locked(id, priority);
            log_.debug("{} queued with priority {}"_format(id, priority));
        }
        work_cv_.notify_one();
        return id;
    }

    void job_manager::enqueue_locked(const std::string& job_id, job_priority priority) {
        auto it = std::ranges::find_if(queue_, [&](const std::string& queued) {
            auto found = jobs_.find(queued);
            return found != jobs_.end() && weight(found->second.job.priority) < weight(priority);
        });
        queue_.insert(it, job_id);
    }

    bool job_manager::cache_fresh_locked(const std::string& key) const {
        auto it = cache_.find(key);
        if (it == cache_.end()) {
            return false;
        }
        return clock_() - it->second.cached_at < std::chrono::seconds{cfg_.cache_ttl_seconds};
    }

    std::optional<std::string> job_manager::dequeue_next() {
        std::lock_guard lock{mutex_};
        return dequeue_locked();
    }

    std::optional<std::string> job_manager::dequeue_locked() {
        while (!queue_.empty() && counts_[detail::status_index(job_status::processing)] < cfg_.max_concurrent_jobs) {
            const auto& head = queue_.front();
            auto it = jobs_.find(head);
            if (it != jobs_.end() && it->second.job.status == job_status::pending) {
                return head;
            }
            queue_.pop_front();
        }
        return std::nullopt;
    }

    job_manager::queued_job& job_manager::find_locked(std::string_view job_id) {
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            throw job_not_found_error("unknown job id: '{}'"_format(job_id));
        }
        return it->second;
    }

    const job_manager::queued_job& job_manager::find_locked(std::string_view job_id) const {
        auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            throw job_not_found_error("unknown job id: '{}'"_format(job_id));
        }
        return it->second;
    }

    void job_manager::transition_locked(queued_job& entry, job_status status) {
        auto& job = entry.job;
        if (!is_valid_transition(job.status, status)) {
            throw invalid_transition_error("{}: cannot move from {} to {}"_format(job.id, job.status, status));
        }

        --counts_[detail::status_index(job.status)];
        ++counts_[detail::status_index(status)];

        if (job.status == job_status::pending) {
            std::erase(queue_, job.id);
        }
        if (status == job_status::processing) {
            job.started_at = clock_();
        }
        if (is_terminal(status)) {
            job.finished_at = clock_();
        }

        log_.debug("{}: {} -> {}"_format(job.id, job.status, status));
        job.status = status;

        if (is_terminal(status)) {
            done_cv_.notify_all();
            work_cv_.notify_all();
        }
    }

    void job_manager::transition(std::string_view job_id, job_status status) {
        std::lock_guard lock{mutex_};
        transition_locked(find_locked(job_id), status);
    }

    job_status_info job_manager::get_status(std::string_view job_id) const {
        std::lock_guard lock{mutex_};
        const auto& entry = find_locked(job_id);

        job_status_info info{entry.job.status, std::nullopt};
        if (entry.job.status == job_status::pending) {
            if (auto it = std::ranges::find(queue_, entry.job.id); it != queue_.end()) {
                info.queue_position = static_cast<std::size_t>(std::distance(queue_.begin(), it)) + 1;
            }
        }
        return info;
    }

    job_result job_manager::get_result(std::string_view job_id) const {
        std::lock_guard lock{mutex_};
        const auto& job = find_locked(job_id).job;
        return job_result{job.status, job.cache_hit, job.result, job.error};
    }

    analysis_job job_manager::get_job(std::string_view job_id) const {
        std::lock_guard lock{mutex_};
        return find_locked(job_id).job;
    }

    bool job_manager::cancel(std::string_view job_id) {
        std::lock_guard lock{mutex_};
        auto& entry = find_locked(job_id);
        if (entry.job.status != job_status::pending) {
            return false;
        }
        transition_locked(entry, job_status::cancelled);
        log_.info("{} cancelled"_format(entry.job.id));
        return true;
    }

    job_status job_manager::wait(std::string_view job_id, std::chrono::milliseconds timeout) {
        std::unique_lock lock{mutex_};
        const auto& job = find_locked(job_id).job;
        done_cv_.wait_for(lock, timeout, [&job] { return is_terminal(job.status); });
        return job.status;
    }

    void job_manager::start() {
        std::lock_guard lock{mutex_};
        if (!workers_.empty()) {
            return;
        }
        shutdown_ = false;
        for (std::size_t i = 0; i < cfg_.max_concurrent_jobs; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
        log_.info("started {} worker(s)"_format(workers_.size()));
    }

    void job_manager::stop() {
        std::vector<std::thread> workers{};
        {
            std::lock_guard lock{mutex_};
            shutdown_ = true;
            workers.swap(workers_);
        }
        work_cv_.notify_all();
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
        if (!workers.empty()) {
            log_.info("stopped {} worker(s)"_format(workers.size()));
        }
    }

    bool job_manager::running() const {
        std::lock_guard lock{mutex_};
        return !workers_.empty();
    }

    void job_manager::worker_loop() {
        while (true) {
            std::string job_id{};
            analysis_request request{};
            {
                std::unique_lock lock{mutex_};
                std::optional<std::string> next{};
                work_cv_.wait(lock, [&] {
                    if (shutdown_) {
                        return true;
                    }
                    next = dequeue_locked();
                    return next.has_value();
                });
                if (shutdown_) {
                    return;
                }
                job_id = *next;
                auto& entry = find_locked(job_id);
                transition_locked(entry, job_status::processing);
                request = entry.request;
            }

            try {
                auto run = runner_(request);
                finish(job_id, std::make_shared<const breakdown_run>(std::move(run)), std::nullopt);
            } catch (const std::exception& e) {
                finish(job_id, nullptr, std::string{e.what()});
            } catch (...) {
                finish(job_id, nullptr, std::string{"unknown error"});
            }
        }
    }

    void job_manager::finish(
            const std::string& job_id, std::shared_ptr<const breakdown_run> result, std::optional<std::string> error) {
        std::lock_guard lock{mutex_};
        auto& entry = find_locked(job_id);
        if (entry.job.status != job_status::processing) {
            log_.debug("{} finished after leaving processing ({}); result dropped"_format(job_id, entry.job.status));
            return;
        }

        if (error) {
            log_.warn("{} failed: {}"_format(job_id, *error));
            entry.job.error = std::move(error);
            transition_locked(entry, job_status::failed);
            return;
        }

        entry.job.result = result;
        if (entry.job.cache_opt_in) {
            cache_[entry.job.cache_key] = cache_entry{result, clock_()};
        }
        transition_locked(entry, job_status::completed);
        log_.info("{} completed with {} scene(s)"_format(job_id, result->scenes.size()));
    }

    job_stats job_manager::stats() const {
        std::lock_guard lock{mutex_};
        return job_stats{
                counts_[detail::status_index(job_status::pending)],
                counts_[detail::status_index(job_status::processing)],
                counts_[detail::status_index(job_status::completed)],
                counts_[detail::status_index(job_status::failed)],
                counts_[detail::status_index(job_status::cancelled)],
                queue_.size(),
                cache_.size(),
                cache_hits_};
    }

    std::size_t job_manager::clear_expired_cache() {
        std::lock_guard lock{mutex_};
        auto now = clock_();
        auto removed = std::erase_if(cache_, [&](const auto& kv) {
            return now - kv.second.cached_at >= std::chrono::seconds{cfg_.cache_ttl_seconds};
        });
        if (removed > 0) {
            log_.debug("cleared {} expired cache entr{}"_format(removed, removed == 1 ? "y" : "ies"));
        }
        return removed;
    }

}  // namespace callsheet
