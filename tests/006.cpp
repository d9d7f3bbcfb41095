#include "utils.hpp"

namespace callsheet::test {

    TEST_CASE("006: wheelchair follows its scene context", "[006][props]") {
        CHECK(classify_item("wheelchair", "he pushes the wheelchair down the street at speed") == prop_category::vehicles);
        CHECK(classify_item("wheelchair", "the patient is sitting in a medical wheelchair") == prop_category::props);

        // one indicator on each side
        CHECK(classify_item("wheelchair", "she pushes the wheelchair into the hospital") == prop_category::props);
        CHECK(classify_item("wheelchair", "") == prop_category::props);

        CHECK(classify_item("كرسي متحرك", "يدفع الكرسي المتحرك بسرعة في الشارع") == prop_category::vehicles);
        CHECK(classify_item("كرسي متحرك", "رأفت مشلول يجلس على كرسي متحرك") == prop_category::props);
    }

    TEST_CASE("006: taxonomy classification", "[006][props]") {
        CHECK(classify_item("car", "") == prop_category::vehicles);
        CHECK(classify_item("taxi", "") == prop_category::vehicles);
        CHECK(classify_item("phone", "") == prop_category::props);
        CHECK(classify_item("table", "") == prop_category::set_dressing);
        CHECK(classify_item("sofa", "") == prop_category::set_dressing);
        CHECK(classify_item("hand mirror", "") == prop_category::props);
        CHECK(classify_item("umbrella", "") == prop_category::props);
        CHECK(classify_item("سيارة", "") == prop_category::vehicles);
        CHECK(classify_item("طاولة", "") == prop_category::set_dressing);
    }

    TEST_CASE("006: canonical item names", "[006][props]") {
        CHECK(canonical_item_name("phone", prop_category::props) == "mobile phone");
        CHECK(canonical_item_name("laptop", prop_category::props) == "laptop computer");
        CHECK(canonical_item_name("envelope", prop_category::props) == "postal envelope");
        CHECK(canonical_item_name("wheelchair", prop_category::props) == "medical wheelchair");
        CHECK(canonical_item_name("wheelchair", prop_category::vehicles) == "motorized wheelchair");
        CHECK(canonical_item_name("keys", prop_category::props) == "keys");
    }

    TEST_CASE("006: scene items land in exactly one category", "[006][props]") {
        SECTION("longer names swallow their parts") {
            detail::scene_fixture fx{
                    "Scene 1 INT OFFICE - DAY\nJohn puts his phone on the desk next to a hand mirror and the keys."};
            auto result = analyze_props(fx.ctx);

            REQUIRE(result.props.size() == 3U);
            CHECK(result.props[0] == "mobile phone");
            CHECK(result.props[1] == "hand mirror");
            CHECK(result.props[2] == "keys");
            REQUIRE(result.set_dressing.size() == 1U);
            CHECK(result.set_dressing[0] == "desk");
            CHECK(result.vehicles.empty());
        }

        SECTION("repeated mentions are listed once") {
            detail::scene_fixture fx{"Scene 1 EXT STREET - DAY\nA car passes. Another car stops. The taxi slows down."};
            auto result = analyze_props(fx.ctx);
            REQUIRE(result.vehicles.size() == 2U);
            CHECK(result.vehicles[0] == "car");
            CHECK(result.vehicles[1] == "taxi");
            CHECK(result.props.empty());
        }

        SECTION("wheelchair pushed down the street is a vehicle") {
            detail::scene_fixture fx{"Scene 1 EXT STREET - DAY\nShe pushes the wheelchair down the road at speed."};
            auto result = analyze_props(fx.ctx);
            REQUIRE(result.vehicles.size() == 1U);
            CHECK(result.vehicles[0] == "motorized wheelchair");
            CHECK(result.props.empty());
        }
    }

}  // namespace callsheet::test
