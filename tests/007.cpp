#include "utils.hpp"

namespace callsheet::test {

    TEST_CASE("007: location classification", "[007][wardrobe]") {
        CHECK(classify_location("VILLA RAFAT") == location_type::villa);
        CHECK(classify_location("POLICE STATION") == location_type::precinct);
        CHECK(classify_location("CITY HOSPITAL - WARD 3") == location_type::hospital);
        CHECK(classify_location("OFFICE") == location_type::office);
        CHECK(classify_location("TV STUDIO") == location_type::station);
        CHECK(classify_location("شقة نهال") == location_type::home);
        CHECK(classify_location("BEDROOM") == location_type::room);
        CHECK(classify_location("CAR") == location_type::car);
        CHECK(classify_location("MARKET") == location_type::exterior);
        CHECK(classify_location("ATTIC") == location_type::other);
    }

    TEST_CASE("007: wardrobe from setting", "[007][wardrobe]") {
        SECTION("office by day") {
            detail::scene_fixture fx{"Scene 1 INT OFFICE - DAY\nJOHN: Morning."};
            auto john = fx.characters.resolve("JOHN");
            CHECK(infer_wardrobe(*john, fx.ctx) == "business attire");
        }

        SECTION("weather adds to the exterior default") {
            detail::scene_fixture fx{"Scene 1 EXT STREET - DAY\nJOHN walks in the rain."};
            auto john = fx.characters.resolve("JOHN");
            CHECK(infer_wardrobe(*john, fx.ctx) == "raincoat over the base costume | everyday street clothes");
        }

        SECTION("no usable context") {
            detail::scene_fixture fx{"Scene 1 INT SOMEWHERE\nJOHN: Hello."};
            auto john = fx.characters.resolve("JOHN");
            CHECK(infer_wardrobe(*john, fx.ctx) == "context-dependent");
        }
    }

    TEST_CASE("007: wardrobe from profile", "[007][wardrobe]") {
        SECTION("upper-class character at a villa at night") {
            detail::scene_fixture fx{"Scene 1 INT VILLA - NIGHT\nرأفت: أين الجميع؟"};
            auto rafat = fx.characters.resolve("رأفت");
            auto description = infer_wardrobe(*rafat, fx.ctx);
            CHECK(description ==
                  "elegant evening wear | luxury upscale outfit | silk loungewear, robe or premium pajamas");
        }

        SECTION("impaired character without upper-class markers") {
            knowledge_base kb{};
            character_profile sami{};
            sami.canonical_name = "SAMI";
            sami.full_name = "Sami Adel";
            sami.psychological_state = "injured";
            kb.add_profile(std::move(sami));

            detail::scene_fixture fx{"Scene 1 INT APARTMENT - NIGHT\nSAMI: Leave me.", std::move(kb)};
            auto profile = fx.characters.resolve("SAMI");
            CHECK(infer_wardrobe(*profile, fx.ctx) == "comfortable home wear or pajamas | loungewear or a soft robe");
        }

        SECTION("profession and class in an office") {
            detail::scene_fixture fx{"Scene 1 INT OFFICE - DAY\nنور: صباح الخير."};
            auto nour = fx.characters.resolve("نور");
            CHECK(infer_wardrobe(*nour, fx.ctx) ==
                  "business attire | fashionable designer outfit | designer business wear");
        }
    }

    TEST_CASE("007: one wardrobe entry per cast member", "[007][wardrobe]") {
        detail::scene_fixture fx{"Scene 1 INT OFFICE - DAY\nJOHN: Morning.\nMARY: Morning."};
        auto result = analyze_wardrobe(fx.ctx, {"JOHN", "MARY"});

        REQUIRE(result.specs.size() == 2U);
        CHECK(result.specs[0].character == "JOHN");
        CHECK(result.specs[1].character == "MARY");
        for (const auto& spec : result.specs) {
            CHECK(spec.is_inferred);
            CHECK(spec.description == "business attire");
            CHECK_FALSE(spec.continuity_note.has_value());
        }

        CHECK(analyze_wardrobe(fx.ctx, {}).specs.empty());
    }

}  // namespace callsheet::test
