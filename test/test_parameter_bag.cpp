#include <iostream>
#include "models/parameter_bag.h"
#include "models/script_models.h"
#include "test_support.h"

using namespace deskpilot;

void testNativeValues() {
    std::cout << "[TEST] Native Values\n";

    ParameterBag bag;
    bag["x"] = std::int64_t{960};
    bag["ratio"] = 0.75;
    bag["text"] = std::string("hello");
    bag["flag"] = true;

    CHECK_EQ(params::getParam<int>(bag, "x", 0), 960);
    CHECK_EQ(params::getParam<double>(bag, "ratio", 0.0), 0.75);
    CHECK_EQ(params::getParam<std::string>(bag, "text", std::string()), "hello");
    CHECK_EQ(params::getParam<bool>(bag, "flag", false), true);
    CHECK(params::hasParam(bag, "x"));
    CHECK(!params::hasParam(bag, "y"));

    std::cout << "[OK] Native values test passed\n\n";
}

void testCoercion() {
    std::cout << "[TEST] Coercion\n";

    ParameterBag bag;
    bag["numericText"] = std::string("42");
    bag["paddedText"] = std::string(" 17 ");
    bag["fraction"] = 2.6;
    bag["intAsDouble"] = std::int64_t{3};
    bag["boolText"] = std::string("TRUE");
    bag["number"] = std::int64_t{1500};

    CHECK_EQ(params::getParam<int>(bag, "numericText", 0), 42);
    CHECK_EQ(params::getParam<int>(bag, "paddedText", 0), 17);
    CHECK_EQ(params::getParam<int>(bag, "fraction", 0), 3);
    CHECK_EQ(params::getParam<double>(bag, "intAsDouble", 0.0), 3.0);
    CHECK_EQ(params::getParam<bool>(bag, "boolText", false), true);
    CHECK_EQ(params::getParam<std::string>(bag, "number", std::string()), "1500");

    std::cout << "[OK] Coercion test passed\n\n";
}

void testFallbacks() {
    std::cout << "[TEST] Fallbacks\n";

    ParameterBag bag;
    bag["word"] = std::string("abc");
    bag["huge"] = std::int64_t{5000000000};
    bag["nothing"] = nlohmann::json(nullptr);

    CHECK_EQ(params::getParam<int>(bag, "missing", 7), 7);
    CHECK_EQ(params::getParam<int>(bag, "word", 7), 7);
    CHECK_EQ(params::getParam<int>(bag, "huge", 7), 7);
    CHECK_EQ(params::getParam<std::int64_t>(bag, "huge", std::int64_t{0}), std::int64_t{5000000000});
    CHECK_EQ(params::getParam<int>(bag, "nothing", 9), 9);
    CHECK_EQ(params::getParam<std::string>(bag, "nothing", std::string("dflt")), "dflt");
    CHECK_EQ(params::getParam<bool>(bag, "word", true), true);

    std::cout << "[OK] Fallbacks test passed\n\n";
}

void testDecodedDocument() {
    std::cout << "[TEST] Decoded Document\n";

    nlohmann::json object = nlohmann::json::parse(R"({
        "x": 100,
        "y": "200",
        "threshold": 0.9,
        "keys": "ctrl+c",
        "region": {"x": 1, "y": 2}
    })");
    ParameterBag bag = params::fromJson(object);

    CHECK_EQ(bag.size(), 5u);
    CHECK_EQ(params::getParam<int>(bag, "x", 0), 100);
    CHECK_EQ(params::getParam<int>(bag, "y", 0), 200);
    CHECK_EQ(params::getParam<double>(bag, "threshold", 0.8), 0.9);
    CHECK_EQ(params::getParam<std::string>(bag, "keys", std::string()), "ctrl+c");
    CHECK_EQ(params::getParam<std::string>(bag, "region", std::string()), R"({"x":1,"y":2})");

    CHECK(params::fromJson(nlohmann::json::array()).empty());

    nlohmann::json back = params::toJson(bag);
    CHECK_EQ(back["x"], 100);
    CHECK_EQ(back["region"]["y"], 2);

    std::cout << "[OK] Decoded document test passed\n\n";
}

void testEnumParameters() {
    std::cout << "[TEST] Enum Parameters\n";

    ParameterBag bag;
    bag["op"] = std::string("or");
    bag["bad"] = std::string("xor");

    CHECK(params::getParam<ConditionOperator>(bag, "op", ConditionOperator::AND) == ConditionOperator::OR);
    CHECK(params::getParam<ConditionOperator>(bag, "bad", ConditionOperator::AND) == ConditionOperator::AND);

    std::cout << "[OK] Enum parameters test passed\n\n";
}

int main() {
    std::cout << "=== DeskPilot Parameter Bag Test Suite ===\n\n";

    try {
        testNativeValues();
        testCoercion();
        testFallbacks();
        testDecodedDocument();
        testEnumParameters();
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
    return test::finish("Parameter bag");
}
