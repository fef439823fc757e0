#include "in_memory_script_storage.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace deskpilot {

namespace {
    template<typename T>
    void sortByName(std::vector<T>& items) {
        std::stable_sort(items.begin(), items.end(), [](const T& a, const T& b) {
            return a.name < b.name;
        });
    }
}

std::optional<AutomationScript> InMemoryScriptStorage::getScript(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_scripts.find(id);
    if (it == m_scripts.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AutomationScript> InMemoryScriptStorage::getAllScripts() {
    std::vector<AutomationScript> scripts;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_scripts) {
            scripts.push_back(entry.second);
        }
    }
    sortByName(scripts);
    return scripts;
}

std::string InMemoryScriptStorage::saveScript(const AutomationScript& script) {
    AutomationScript stored = script;
    if (stored.id.empty()) {
        stored.id = generateId();
    }
    stored.modifiedAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_scripts[stored.id] = stored;
    return stored.id;
}

bool InMemoryScriptStorage::deleteScript(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scripts.erase(id) > 0;
}

std::optional<TemplateImage> InMemoryScriptStorage::getTemplateImage(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_templates.find(id);
    if (it == m_templates.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TemplateImage> InMemoryScriptStorage::getAllTemplateImages() {
    std::vector<TemplateImage> images;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_templates) {
            images.push_back(entry.second);
        }
    }
    sortByName(images);
    return images;
}

std::string InMemoryScriptStorage::saveTemplateImage(const TemplateImage& image) {
    TemplateImage stored = image;
    if (stored.id.empty()) {
        stored.id = generateId();
    }
    stored.createdAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_templates[stored.id] = stored;
    return stored.id;
}

bool InMemoryScriptStorage::deleteTemplateImage(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_templates.erase(id) > 0;
}

void InMemoryScriptStorage::seedSampleData() {
    auto now = std::chrono::system_clock::now();

    ScriptAction click;
    click.id = generateId();
    click.type = ActionType::CLICK;
    click.typeName = toString(ActionType::CLICK);
    click.parameters["x"] = std::int64_t{960};
    click.parameters["y"] = std::int64_t{540};

    ScriptStep clickStep;
    clickStep.id = generateId();
    clickStep.order = 1;
    clickStep.type = StepType::ACTION;
    clickStep.typeName = toString(StepType::ACTION);
    clickStep.name = "Click center of screen";
    clickStep.actions.push_back(click);

    ScriptStep waitStep;
    waitStep.id = generateId();
    waitStep.order = 2;
    waitStep.type = StepType::WAIT;
    waitStep.typeName = toString(StepType::WAIT);
    waitStep.name = "Wait 2 seconds";
    waitStep.parameters["milliseconds"] = std::int64_t{2000};

    AutomationScript script;
    script.id = kSampleScriptId;
    script.name = "Sample Click Script";
    script.description = "A simple script that clicks in the center of the screen";
    script.createdAt = now;
    script.modifiedAt = now;
    script.steps = {clickStep, waitStep};

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scripts[script.id] = script;
    }
    SLOG_DEBUG().message("Sample script seeded").context("script_id", script.id);
}

} // namespace deskpilot
