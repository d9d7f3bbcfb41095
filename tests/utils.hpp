#pragma once

#include "callsheet.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace callsheet::test::detail {

    namespace fs = std::filesystem;

    // Owns everything a scene_context borrows; the context is built from the first scene of `text`.
    struct scene_fixture {
        scene_block block;
        scene_header header;
        scene_type type;
        knowledge_base knowledge;
        character_registry characters;
        scene_context ctx;

        explicit scene_fixture(std::string text, knowledge_base kb = knowledge_base::builtin())
            : block{split_scenes(text).front()},
              header{parse_header(block)},
              type{classify_scene_type(block.raw_text)},
              knowledge{std::move(kb)},
              characters{knowledge},
              ctx{make_scene_context(block, header, type, knowledge, characters)} {}
    };

    struct captured_log {
        std::vector<std::string> lines{};

        logger make(log_level threshold = log_level::debug) {
            return logger{threshold, [this](log_level level, std::string_view line) {
                              lines.push_back(std::string{to_string(level)} + " " + std::string{line});
                          }};
        }

        bool contains(std::string_view needle) const {
            return std::ranges::any_of(lines, [&](const std::string& l) { return l.find(needle) != std::string::npos; });
        }
    };

    inline bool contains(const std::vector<std::string>& values, std::string_view value) {
        return std::ranges::find(values, value) != values.end();
    }

    inline fs::path write_temp_file(std::string_view name, std::string_view content) {
        auto dir = fs::temp_directory_path() / "callsheet_tests";
        fs::create_directories(dir);
        auto path = dir / name;
        std::ofstream out{path, std::ios::binary};
        out << content;
        return path;
    }

    inline constexpr std::string_view two_scene_script =
            "Scene 1 INT DAY OFFICE\n"
            "JOHN: I need the report by tonight.\n"
            "\n"
            "Scene 2 EXT NIGHT STREET\n"
            "JOHN enters a car and drives away.\n";

}  // namespace callsheet::test::detail
