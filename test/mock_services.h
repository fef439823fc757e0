#ifndef DESKPILOT_MOCK_SERVICES_H
#define DESKPILOT_MOCK_SERVICES_H

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "ocal/automation_engine.h"
#include "environmental_perception/screenshot_service.h"
#include "environmental_perception/image_recognition.h"
#include "storage/in_memory_script_storage.h"

namespace deskpilot {
namespace test {

/**
 * @brief Automation engine that records every call instead of sending input
 */
class RecordingAutomationEngine : public IAutomationEngine {
public:
    void click(int x, int y) override {
        if (failClicks) {
            throw std::runtime_error("click rejected");
        }
        record("click(" + std::to_string(x) + "," + std::to_string(y) + ")");
    }
    void doubleClick(int x, int y) override {
        record("doubleClick(" + std::to_string(x) + "," + std::to_string(y) + ")");
    }
    void rightClick(int x, int y) override {
        record("rightClick(" + std::to_string(x) + "," + std::to_string(y) + ")");
    }
    void moveMouse(int x, int y) override {
        record("moveMouse(" + std::to_string(x) + "," + std::to_string(y) + ")");
    }
    void drag(const ScreenPoint& from, const ScreenPoint& to) override {
        record("drag(" + std::to_string(from.x) + "," + std::to_string(from.y) + "->" +
               std::to_string(to.x) + "," + std::to_string(to.y) + ")");
    }
    void typeText(const std::string& text) override {
        record("typeText(" + text + ")");
    }
    void sendKeys(const std::string& keys) override {
        record("sendKeys(" + keys + ")");
    }
    bool wait(std::chrono::milliseconds duration, CancellationToken& token) override {
        record("wait(" + std::to_string(duration.count()) + ")");
        return token.sleepFor(duration);
    }
    ScreenPoint getMousePosition() override {
        return ScreenPoint{};
    }

    void setTargetWindow(WindowHandle handle) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_target = handle;
        m_targetHistory.push_back("set(" + std::to_string(handle) + ")");
    }
    void clearTargetWindow() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_target.reset();
        m_targetHistory.push_back("clear");
    }
    bool hasTargetWindow() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_target.has_value();
    }
    std::optional<WindowHandle> getTargetWindow() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_target;
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }
    std::vector<std::string> targetHistory() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_targetHistory;
    }
    size_t countCalls(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (const auto& call : m_calls) {
            if (call.compare(0, prefix.size(), prefix) == 0) {
                ++count;
            }
        }
        return count;
    }

    std::atomic<bool> failClicks{false};

private:
    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls.push_back(call);
    }

    mutable std::mutex m_mutex;
    std::vector<std::string> m_calls;
    std::vector<std::string> m_targetHistory;
    std::optional<WindowHandle> m_target;
};

/**
 * @brief Screenshot service returning fixed bytes and recording saves
 */
class FakeScreenshotService : public IScreenshotService {
public:
    ImageBytes captureFullScreen() override {
        ++captures;
        return ImageBytes{0x89, 'P', 'N', 'G'};
    }
    ImageBytes captureRegion(const ScreenRegion&) override {
        ++captures;
        return ImageBytes{0x89, 'P', 'N', 'G'};
    }
    std::string saveScreenshot(const ImageBytes&, const std::string& fileName) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_savedNames.push_back(fileName);
        return "shots/" + fileName + ".png";
    }
    ScreenRegion getScreenBounds() override {
        return ScreenRegion{0, 0, 1920, 1080};
    }
    TemplateImage createTemplateImage(const ScreenRegion& region, const std::string& name) override {
        TemplateImage image;
        image.name = name;
        image.captureRegion = region;
        image.imageData = captureRegion(region);
        return image;
    }

    std::vector<std::string> savedNames() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_savedNames;
    }

    std::atomic<int> captures{0};

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_savedNames;
};

/**
 * @brief Matcher whose answer is set by the test
 */
class ScriptedMatcher : public IImageRecognitionService {
public:
    using IImageRecognitionService::findImage;

    MatchResult findImage(const ImageBytes&, const ImageBytes&, double threshold) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_thresholds.push_back(threshold);
        }
        ++searches;
        if (fail) {
            throw std::runtime_error("matcher exploded");
        }

        MatchResult result;
        result.found = found && confidence >= threshold;
        result.confidence = confidence;
        result.location = ScreenPoint{40, 50};
        result.boundingBox = ScreenRegion{40, 50, 10, 10};
        return result;
    }

    std::vector<MatchResult> findAllImages(const ImageBytes& screen, const ImageBytes& templ,
                                           double threshold) override {
        std::vector<MatchResult> results;
        MatchResult result = findImage(screen, templ, threshold);
        if (result.found) {
            results.push_back(result);
        }
        return results;
    }

    std::vector<double> thresholds() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_thresholds;
    }

    std::atomic<bool> found{false};
    std::atomic<bool> fail{false};
    std::atomic<double> confidence{0.0};
    std::atomic<int> searches{0};

private:
    mutable std::mutex m_mutex;
    std::vector<double> m_thresholds;
};

// Script building helpers

inline ScriptAction makeAction(ActionType type, ParameterBag parameters = {}) {
    ScriptAction action;
    action.id = generateId();
    action.type = type;
    action.typeName = toString(type);
    action.parameters = std::move(parameters);
    return action;
}

inline ScriptAction makeClick(int x, int y) {
    ParameterBag parameters;
    parameters["x"] = std::int64_t{x};
    parameters["y"] = std::int64_t{y};
    return makeAction(ActionType::CLICK, parameters);
}

inline ScriptCondition makeCondition(ConditionType type, ConditionOperator op = ConditionOperator::AND,
                                     ParameterBag parameters = {}) {
    ScriptCondition condition;
    condition.id = generateId();
    condition.type = type;
    condition.typeName = toString(type);
    condition.op = op;
    condition.parameters = std::move(parameters);
    return condition;
}

inline ScriptStep makeStep(const std::string& id, StepType type, const std::string& name) {
    ScriptStep step;
    step.id = id;
    step.type = type;
    step.typeName = toString(type);
    step.name = name;
    return step;
}

inline ScriptStep makeActionStep(const std::string& id, const std::string& name, ScriptAction action) {
    ScriptStep step = makeStep(id, StepType::ACTION, name);
    step.actions.push_back(std::move(action));
    return step;
}

inline ScriptStep makeWaitStep(const std::string& id, const std::string& name, int milliseconds) {
    ScriptStep step = makeStep(id, StepType::WAIT, name);
    step.parameters["milliseconds"] = std::int64_t{milliseconds};
    return step;
}

inline ScriptStep makeJumpStep(const std::string& id, const std::string& name, const std::string& target) {
    ScriptStep step = makeStep(id, StepType::JUMP, name);
    step.parameters["targetStepId"] = target;
    return step;
}

inline AutomationScript makeScript(const std::string& id, const std::string& name, std::vector<ScriptStep> steps) {
    AutomationScript script;
    script.id = id;
    script.name = name;
    script.createdAt = std::chrono::system_clock::now();
    script.modifiedAt = script.createdAt;
    script.steps = std::move(steps);
    return script;
}

} // namespace test
} // namespace deskpilot

#endif // DESKPILOT_MOCK_SERVICES_H
