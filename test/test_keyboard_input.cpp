#include <iostream>
#include <thread>
#include "ocal/keyboard_control.h"
#include "ocal/automation_engine.h"
#include "common/cancellation_token.h"
#include "common/error_handler.h"
#include "test_support.h"

using namespace deskpilot;
using ocal::keyboard::Key;
using ocal::keyboard::KeyCombination;

void testParseCombinations() {
    std::cout << "[TEST] Parse Combinations\n";

    auto copy = ocal::keyboard::parseKeyCombination("ctrl+c");
    CHECK(copy.has_value());
    if (copy) {
        CHECK((*copy == KeyCombination{Key::CTRL, Key::C}));
    }

    auto save = ocal::keyboard::parseKeyCombination(" Control + Shift + s ");
    CHECK(save.has_value());
    if (save) {
        CHECK((*save == KeyCombination{Key::CTRL, Key::SHIFT, Key::S}));
    }

    auto enter = ocal::keyboard::parseKeyCombination("RETURN");
    CHECK(enter.has_value() && enter->size() == 1 && enter->front() == Key::ENTER);

    auto named = ocal::keyboard::parseKeyCombination("alt+f4");
    CHECK(named.has_value() && (*named == KeyCombination{Key::ALT, Key::F4}));

    auto navigation = ocal::keyboard::parseKeyCombination("win+pageup+del+esc+7");
    CHECK(navigation.has_value());
    if (navigation) {
        CHECK((*navigation == KeyCombination{Key::WINDOWS, Key::PAGE_UP, Key::DELETE_KEY, Key::ESCAPE, Key::NUM_7}));
    }

    std::cout << "[OK] Parse combinations test passed\n\n";
}

void testInvalidCombinations() {
    std::cout << "[TEST] Invalid Combinations\n";

    CHECK(!ocal::keyboard::parseKeyCombination("").has_value());
    CHECK(!ocal::keyboard::parseKeyCombination("ctrl+").has_value());
    CHECK(!ocal::keyboard::parseKeyCombination("ctrl++c").has_value());
    CHECK(!ocal::keyboard::parseKeyCombination("hyper+c").has_value());
    CHECK(!ocal::keyboard::parseKeyCombination("F13").has_value());
    CHECK(!ocal::keyboard::parseKeyCombination("#").has_value());

    std::cout << "[OK] Invalid combinations test passed\n\n";
}

void testKeyNames() {
    std::cout << "[TEST] Key Names\n";

    CHECK(ocal::keyboard::isModifier(Key::SHIFT));
    CHECK(ocal::keyboard::isModifier(Key::WINDOWS));
    CHECK(!ocal::keyboard::isModifier(Key::A));
    CHECK_EQ(ocal::keyboard::keyToString(Key::F12), "F12");
    CHECK_EQ(ocal::keyboard::keyToString(Key::NUM_3), "3");
    CHECK_EQ(ocal::keyboard::combinationToString(KeyCombination{Key::CTRL, Key::ALT, Key::DELETE_KEY}),
             "CTRL+ALT+DELETE");

    auto parsed = ocal::keyboard::parseKeyCombination(
        ocal::keyboard::combinationToString(KeyCombination{Key::SHIFT, Key::ARROW_LEFT, Key::PAGE_DOWN}));
    CHECK(parsed.has_value() && (*parsed == KeyCombination{Key::SHIFT, Key::ARROW_LEFT, Key::PAGE_DOWN}));

    std::cout << "[OK] Key names test passed\n\n";
}

void testAutomationEngineRejectsBadKeys() {
    std::cout << "[TEST] Automation Engine Rejects Bad Keys\n";

    DesktopAutomationEngine engine;
    CHECK_THROWS(engine.sendKeys("ctrl+banana"), DeskpilotException);

    try {
        engine.sendKeys("");
        CHECK(false);
    } catch (const DeskpilotException& e) {
        CHECK(e.getType() == ErrorType::INPUT_ERROR);
        CHECK(std::string(e.what()).find("Invalid key combination") != std::string::npos);
    }

    std::cout << "[OK] Automation engine rejects bad keys test passed\n\n";
}

void testAutomationEngineTargetWindow() {
    std::cout << "[TEST] Automation Engine Target Window\n";

    DesktopAutomationEngine engine;
    CHECK(!engine.hasTargetWindow());

    engine.setTargetWindow(0x1234);
    CHECK(engine.hasTargetWindow());
    CHECK(engine.getTargetWindow() == std::optional<WindowHandle>(0x1234));

    engine.clearTargetWindow();
    CHECK(!engine.hasTargetWindow());
    CHECK(!engine.getTargetWindow().has_value());

    std::cout << "[OK] Automation engine target window test passed\n\n";
}

void testAutomationEngineWait() {
    std::cout << "[TEST] Automation Engine Wait\n";

    DesktopAutomationEngine engine;
    CancellationToken token;

    auto start = std::chrono::steady_clock::now();
    CHECK(engine.wait(std::chrono::milliseconds(20), token));
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(20));

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        token.cancel();
    });
    start = std::chrono::steady_clock::now();
    CHECK(!engine.wait(std::chrono::seconds(10), token));
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    canceller.join();

    std::cout << "[OK] Automation engine wait test passed\n\n";
}

int main() {
    std::cout << "=== DeskPilot Keyboard Input Test Suite ===\n\n";

    try {
        testParseCombinations();
        testInvalidCombinations();
        testKeyNames();
        testAutomationEngineRejectsBadKeys();
        testAutomationEngineTargetWindow();
        testAutomationEngineWait();
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
    return test::finish("Keyboard input");
}
