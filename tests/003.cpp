#include "utils.hpp"

namespace callsheet::test {

    TEST_CASE("003: one block per marker in ascending numeric order", "[003][splitter]") {
        constexpr std::string_view script =
                "Title page, written by someone\n"
                "\n"
                "Scene 10 INT OFFICE - DAY\n"
                "JOHN: Ten.\n"
                "Scene 2 EXT STREET - NIGHT\n"
                "MARY: Two.\n"
                "Scene 9 INT ROOM - DAY\n"
                "MARY: Nine.\n";

        auto blocks = split_scenes(script);
        REQUIRE(blocks.size() == 3U);
        CHECK(blocks[0].scene_number == "2");
        CHECK(blocks[1].scene_number == "9");
        CHECK(blocks[2].scene_number == "10");

        CHECK(blocks[0].raw_text == "Scene 2 EXT STREET - NIGHT\nMARY: Two.");
        for (const auto& b : blocks) {
            CHECK(b.raw_text.find("Title page") == std::string::npos);
        }
    }

    TEST_CASE("003: localized markers and digits", "[003][splitter]") {
        constexpr std::string_view script =
                "مشهد ٢ داخلي - شقة نهال - ليل\n"
                "نهال: أين كنت؟\n"
                "المشهد 1 خارجي - شارع - نهار\n"
                "يدخل رأفت\n"
                "SCENE #3 INT CAFE\n"
                "Sc. 4 EXT PARK\n";

        auto blocks = split_scenes(script);
        REQUIRE(blocks.size() == 4U);
        CHECK(blocks[0].scene_number == "1");
        CHECK(blocks[1].scene_number == "2");
        CHECK(blocks[2].scene_number == "3");
        CHECK(blocks[3].scene_number == "4");
        CHECK(blocks[1].raw_text.starts_with("مشهد ٢ داخلي"));
    }

    TEST_CASE("003: only the marker number is normalized", "[003][splitter]") {
        auto blocks = split_scenes("مشهد ٣ داخلي - شقة نهال - ليل\nنهال: الساعة ١١ وما زلت أنتظر.\n");
        REQUIRE(blocks.size() == 1U);
        CHECK(blocks[0].scene_number == "3");
        CHECK(blocks[0].raw_text == "مشهد ٣ داخلي - شقة نهال - ليل\nنهال: الساعة ١١ وما زلت أنتظر.");

        auto header = parse_header(blocks[0]);
        CHECK(header.location == "شقة نهال");
        CHECK(header.time == time_of_day::night);
        CHECK(count_dialogue_lines(blocks[0].raw_text) == 1U);
    }

    TEST_CASE("003: repeated numbers keep textual order", "[003][splitter]") {
        auto blocks = split_scenes("Scene 5 first\nA\nScene 5 second\nB\nScene 4 before\nC\n");
        REQUIRE(blocks.size() == 3U);
        CHECK(blocks[0].raw_text.starts_with("Scene 4"));
        CHECK(blocks[1].raw_text.starts_with("Scene 5 first"));
        CHECK(blocks[2].raw_text.starts_with("Scene 5 second"));
    }

    TEST_CASE("003: documents without markers are rejected", "[003][splitter]") {
        CHECK_THROWS_AS(split_scenes("Just some prose.\nNo scenes here, not even scenery 5.\n"), no_scenes_found_error);
        CHECK_THROWS_AS(split_scenes(""), no_scenes_found_error);
    }

    TEST_CASE("003: scene numbers must be numeric", "[003][splitter]") {
        CHECK(scene_ordinal(scene_block{"12", "Scene 12"}) == 12U);
        CHECK_THROWS_AS(scene_ordinal(scene_block{"12a", "Scene 12a"}), scene_parse_error);
        CHECK_THROWS_AS(scene_ordinal(scene_block{"", ""}), scene_parse_error);
    }

}  // namespace callsheet::test
