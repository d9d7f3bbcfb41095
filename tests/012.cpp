#include "utils.hpp"

namespace callsheet::test {

    using namespace std::chrono_literals;

    namespace detail {

        static analysis_request request_for(std::string text, job_priority priority = job_priority::normal) {
            analysis_request req{};
            req.text = std::move(text);
            req.priority = priority;
            return req;
        }

        static job_manager::runner_fn empty_runner() {
            return [](const analysis_request&) { return breakdown_run{}; };
        }

    }  // namespace detail

    TEST_CASE("012: job state machine", "[012][jobs]") {
        CHECK(is_valid_transition(job_status::pending, job_status::processing));
        CHECK(is_valid_transition(job_status::pending, job_status::cancelled));
        CHECK(is_valid_transition(job_status::processing, job_status::completed));
        CHECK(is_valid_transition(job_status::processing, job_status::failed));
        CHECK(is_valid_transition(job_status::processing, job_status::cancelled));
        CHECK_FALSE(is_valid_transition(job_status::pending, job_status::completed));
        CHECK_FALSE(is_valid_transition(job_status::completed, job_status::processing));
        CHECK_FALSE(is_valid_transition(job_status::cancelled, job_status::pending));
        CHECK_FALSE(is_valid_transition(job_status::failed, job_status::failed));
    }

    TEST_CASE("012: cache keys", "[012][jobs]") {
        auto a = detail::request_for("Scene 1 INT ROOM\nJOHN: Hi.");
        auto b = a;
        CHECK(make_cache_key(a) == make_cache_key(b));

        b.component = analysis_component::cast_analysis;
        CHECK(make_cache_key(a) != make_cache_key(b));

        auto c = a;
        c.confidence_threshold = 0.75;
        CHECK(make_cache_key(a) != make_cache_key(c));

        auto d = a;
        d.priority = job_priority::critical;
        CHECK(make_cache_key(a) == make_cache_key(d));
    }

    TEST_CASE("012: queue order follows priority, then submission", "[012][jobs]") {
        pipeline_config cfg{};
        cfg.max_concurrent_jobs = 4;
        job_manager jobs{cfg, logger{}, detail::empty_runner()};

        CHECK(jobs.submit(detail::request_for("a", job_priority::normal)) == "job-1");
        CHECK(jobs.submit(detail::request_for("b", job_priority::critical)) == "job-2");
        CHECK(jobs.submit(detail::request_for("c", job_priority::normal)) == "job-3");
        CHECK(jobs.submit(detail::request_for("d", job_priority::critical)) == "job-4");

        CHECK(jobs.get_status("job-2").queue_position == std::optional<std::size_t>{1U});
        CHECK(jobs.get_status("job-1").queue_position == std::optional<std::size_t>{3U});
        CHECK(jobs.get_status("job-3").queue_position == std::optional<std::size_t>{4U});

        std::vector<std::string> order{};
        while (auto next = jobs.dequeue_next()) {
            order.push_back(*next);
            jobs.transition(*next, job_status::processing);
        }
        CHECK(order == std::vector<std::string>{"job-2", "job-4", "job-1", "job-3"});

        auto status = jobs.get_status("job-1");
        CHECK(status.status == job_status::processing);
        CHECK_FALSE(status.queue_position.has_value());
        CHECK(jobs.stats().processing == 4U);
        CHECK(jobs.stats().queue_length == 0U);
    }

    TEST_CASE("012: processing slots are capped", "[012][jobs]") {
        pipeline_config cfg{};
        cfg.max_concurrent_jobs = 1;
        job_manager jobs{cfg, logger{}, detail::empty_runner()};

        auto first = jobs.submit(detail::request_for("a"));
        auto second = jobs.submit(detail::request_for("b"));

        auto next = jobs.dequeue_next();
        REQUIRE(next == std::optional<std::string>{first});
        CHECK(jobs.dequeue_next() == next);

        jobs.transition(first, job_status::processing);
        CHECK_FALSE(jobs.dequeue_next().has_value());

        jobs.transition(first, job_status::completed);
        CHECK(jobs.dequeue_next() == std::optional<std::string>{second});
        CHECK(jobs.get_job(first).finished_at.has_value());
    }

    TEST_CASE("012: invalid requests", "[012][jobs]") {
        job_manager jobs{pipeline_config{}, logger{}, detail::empty_runner()};
        auto id = jobs.submit(detail::request_for("a"));

        CHECK_THROWS_AS(jobs.transition(id, job_status::completed), invalid_transition_error);
        CHECK(jobs.get_status(id).status == job_status::pending);

        CHECK_THROWS_AS(jobs.get_status("job-99"), job_not_found_error);
        CHECK_THROWS_AS(jobs.get_result("nope"), job_not_found_error);
        CHECK_THROWS_AS(jobs.cancel("nope"), job_not_found_error);
        CHECK_THROWS_AS(jobs.transition("nope", job_status::processing), job_not_found_error);

        jobs.transition(id, job_status::processing);
        jobs.transition(id, job_status::completed);
        CHECK_THROWS_AS(jobs.transition(id, job_status::processing), invalid_transition_error);
    }

    TEST_CASE("012: cancellation", "[012][jobs]") {
        job_manager jobs{pipeline_config{}, logger{}, detail::empty_runner()};
        auto a = jobs.submit(detail::request_for("a"));
        auto b = jobs.submit(detail::request_for("b"));

        CHECK(jobs.cancel(a));
        CHECK(jobs.get_status(a).status == job_status::cancelled);
        CHECK_FALSE(jobs.cancel(a));
        CHECK(jobs.stats().queue_length == 1U);
        CHECK(jobs.stats().cancelled == 1U);
        CHECK(jobs.get_status(b).queue_position == std::optional<std::size_t>{1U});

        jobs.transition(b, job_status::processing);
        CHECK_FALSE(jobs.cancel(b));
        CHECK(jobs.get_status(b).status == job_status::processing);
    }

    TEST_CASE("012: identical requests are served from cache", "[012][jobs]") {
        std::atomic<int> calls{0};
        job_manager jobs{pipeline_config{}, logger{}, [&calls](const analysis_request&) {
                             ++calls;
                             breakdown_run run{};
                             run.scenes.emplace_back().scene_number = "1";
                             return run;
                         }};
        jobs.start();
        REQUIRE(jobs.running());

        auto first = jobs.submit(detail::request_for("script"));
        REQUIRE(jobs.wait(first, 5s) == job_status::completed);
        auto result = jobs.get_result(first);
        REQUIRE(result.result != nullptr);
        CHECK(result.result->scenes.size() == 1U);
        CHECK_FALSE(result.cache_hit);

        auto second = jobs.submit(detail::request_for("script"));
        auto cached = jobs.get_result(second);
        CHECK(cached.status == job_status::completed);
        CHECK(cached.cache_hit);
        CHECK(cached.result == result.result);
        CHECK(calls == 1);

        auto opted_out = detail::request_for("script");
        opted_out.cache_opt_in = false;
        auto third = jobs.submit(opted_out);
        REQUIRE(jobs.wait(third, 5s) == job_status::completed);
        CHECK_FALSE(jobs.get_result(third).cache_hit);
        CHECK(calls == 2);

        auto stats = jobs.stats();
        CHECK(stats.completed == 3U);
        CHECK(stats.cache_hits == 1U);
        CHECK(stats.cache_entries == 1U);

        jobs.stop();
        CHECK_FALSE(jobs.running());
    }

    TEST_CASE("012: cached results expire", "[012][jobs]") {
        std::atomic<int> calls{0};
        std::atomic<int> offset_seconds{0};
        auto base = job_clock::now();

        pipeline_config cfg{};
        cfg.cache_ttl_seconds = 60;
        job_manager jobs{
                cfg,
                logger{},
                [&calls](const analysis_request&) {
                    ++calls;
                    return breakdown_run{};
                },
                [&] { return base + std::chrono::seconds{offset_seconds.load()}; }};
        jobs.start();

        REQUIRE(jobs.wait(jobs.submit(detail::request_for("script")), 5s) == job_status::completed);

        offset_seconds = 30;
        CHECK(jobs.get_result(jobs.submit(detail::request_for("script"))).cache_hit);
        CHECK(jobs.clear_expired_cache() == 0U);

        offset_seconds = 61;
        auto expired = jobs.submit(detail::request_for("script"));
        REQUIRE(jobs.wait(expired, 5s) == job_status::completed);
        CHECK_FALSE(jobs.get_result(expired).cache_hit);
        CHECK(calls == 2);

        offset_seconds = 500;
        CHECK(jobs.clear_expired_cache() == 1U);
        CHECK(jobs.stats().cache_entries == 0U);
    }

    TEST_CASE("012: a failing job does not affect the others", "[012][jobs]") {
        detail::captured_log log{};
        job_manager jobs{pipeline_config{}, log.make(log_level::warn), [](const analysis_request& req) {
                             if (req.text == "bad") {
                                 throw std::runtime_error{"boom"};
                             }
                             return breakdown_run{};
                         }};
        jobs.start();

        auto bad = jobs.submit(detail::request_for("bad"));
        auto good = jobs.submit(detail::request_for("good"));
        REQUIRE(jobs.wait(bad, 5s) == job_status::failed);
        REQUIRE(jobs.wait(good, 5s) == job_status::completed);

        auto failed = jobs.get_result(bad);
        CHECK(failed.error == std::optional<std::string>{"boom"});
        CHECK(failed.result == nullptr);
        CHECK(jobs.stats().failed == 1U);
        CHECK(jobs.stats().cache_entries == 1U);

        jobs.stop();
        CHECK(log.contains("failed: boom"));
    }

    TEST_CASE("012: default runner analyzes the requested component", "[012][jobs]") {
        auto kb = knowledge_base::builtin();
        job_manager jobs{pipeline_config{}, logger{}, kb};
        jobs.start();

        auto req = detail::request_for(std::string{detail::two_scene_script});
        req.component = analysis_component::cast_analysis;
        auto id = jobs.submit(req);
        REQUIRE(jobs.wait(id, 5s) == job_status::completed);

        auto result = jobs.get_result(id).result;
        REQUIRE(result != nullptr);
        REQUIRE(result->scenes.size() == 2U);
        CHECK(detail::contains(result->scenes[0].cast, "JOHN"));
        CHECK(result->scenes[1].vehicles.empty());
        CHECK(result->scenes[1].wardrobe.empty());

        auto broken = jobs.submit(detail::request_for("no markers here"));
        CHECK(jobs.wait(broken, 5s) == job_status::failed);
        CHECK(jobs.get_result(broken).error.has_value());
    }

    TEST_CASE("012: stopping leaves queued jobs pending", "[012][jobs]") {
        job_manager jobs{pipeline_config{}, logger{}, detail::empty_runner()};
        auto id = jobs.submit(detail::request_for("a"));

        CHECK_FALSE(jobs.running());
        jobs.stop();
        CHECK(jobs.get_status(id).status == job_status::pending);
        CHECK(jobs.wait(id, 10ms) == job_status::pending);

        auto stats = jobs.stats();
        CHECK(stats.pending == 1U);
        CHECK(stats.queue_length == 1U);
    }

}  // namespace callsheet::test
