#include "desktop_screenshot_service.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include "../common/config_manager.h"
#include "../common/file_utils.h"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#endif

namespace deskpilot {

namespace {
    std::string defaultScreenshotName() {
        auto now = std::chrono::system_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::time_t raw = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &raw);
#else
        localtime_r(&raw, &local);
#endif
        std::ostringstream ss;
        ss << "screenshot_" << std::put_time(&local, "%Y%m%d_%H%M%S")
           << '_' << std::setw(3) << std::setfill('0') << millis;
        return ss.str();
    }

    ImageBytes encodePng(const cv::Mat& image) {
        std::vector<uchar> buffer;
        if (!cv::imencode(".png", image, buffer)) {
            DESKPILOT_THROW(ErrorType::CAPTURE_ERROR, ErrorSeverity::MEDIUM,
                            "Failed to encode screen capture as PNG", "", "DesktopScreenshotService");
        }
        return ImageBytes(buffer.begin(), buffer.end());
    }
}

#ifdef _WIN32
struct DesktopScreenshotService::DisplayConnection {
    HDC screen = nullptr;
    int width = 0;
    int height = 0;

    DisplayConnection() {
        screen = GetDC(nullptr);
        if (!screen) {
            DESKPILOT_THROW(ErrorType::CAPTURE_ERROR, ErrorSeverity::HIGH,
                            "Cannot acquire screen device context", "", "DesktopScreenshotService");
        }
        width = GetSystemMetrics(SM_CXSCREEN);
        height = GetSystemMetrics(SM_CYSCREEN);
    }

    ~DisplayConnection() {
        ReleaseDC(nullptr, screen);
    }

    cv::Mat grab(const ScreenRegion& area) {
        HDC memoryDc = CreateCompatibleDC(screen);
        HBITMAP bitmap = CreateCompatibleBitmap(screen, area.width, area.height);
        HGDIOBJ previous = SelectObject(memoryDc, bitmap);
        BOOL copied = BitBlt(memoryDc, 0, 0, area.width, area.height, screen, area.x, area.y, SRCCOPY);

        BITMAPINFOHEADER header = {};
        header.biSize = sizeof(BITMAPINFOHEADER);
        header.biWidth = area.width;
        header.biHeight = -area.height;  // Top-down rows
        header.biPlanes = 1;
        header.biBitCount = 32;
        header.biCompression = BI_RGB;

        cv::Mat pixels(area.height, area.width, CV_8UC4);
        int rows = copied ? GetDIBits(memoryDc, bitmap, 0, static_cast<UINT>(area.height), pixels.data,
                                      reinterpret_cast<BITMAPINFO*>(&header), DIB_RGB_COLORS)
                          : 0;

        SelectObject(memoryDc, previous);
        DeleteObject(bitmap);
        DeleteDC(memoryDc);

        if (rows != area.height) {
            DESKPILOT_THROW(ErrorType::CAPTURE_ERROR, ErrorSeverity::MEDIUM,
                            "BitBlt screen capture failed", "error " + std::to_string(GetLastError()),
                            "DesktopScreenshotService");
        }

        cv::Mat bgr;
        cv::cvtColor(pixels, bgr, cv::COLOR_BGRA2BGR);
        return bgr;
    }
};
#else
struct DesktopScreenshotService::DisplayConnection {
    Display* display = nullptr;
    Window root = 0;
    int width = 0;
    int height = 0;

    DisplayConnection() {
        display = XOpenDisplay(nullptr);
        if (!display) {
            DESKPILOT_THROW(ErrorType::CAPTURE_ERROR, ErrorSeverity::HIGH,
                            "Cannot open X display", "DISPLAY may be unset", "DesktopScreenshotService");
        }
        root = DefaultRootWindow(display);
        Screen* screen = DefaultScreenOfDisplay(display);
        width = screen->width;
        height = screen->height;
    }

    ~DisplayConnection() {
        XCloseDisplay(display);
    }

    cv::Mat grab(const ScreenRegion& area) {
        XImage* image = XGetImage(display, root, area.x, area.y,
                                  static_cast<unsigned int>(area.width),
                                  static_cast<unsigned int>(area.height), AllPlanes, ZPixmap);
        if (!image) {
            DESKPILOT_THROW(ErrorType::CAPTURE_ERROR, ErrorSeverity::MEDIUM,
                            "XGetImage failed", "", "DesktopScreenshotService");
        }
        if (image->bits_per_pixel != 32) {
            int bits = image->bits_per_pixel;
            XDestroyImage(image);
            DESKPILOT_THROW(ErrorType::CAPTURE_ERROR, ErrorSeverity::MEDIUM,
                            "Unsupported X visual", std::to_string(bits) + " bits per pixel",
                            "DesktopScreenshotService");
        }

        cv::Mat pixels(area.height, area.width, CV_8UC4, image->data,
                       static_cast<size_t>(image->bytes_per_line));
        cv::Mat bgr;
        cv::cvtColor(pixels, bgr, cv::COLOR_BGRA2BGR);
        XDestroyImage(image);
        return bgr;
    }
};
#endif

DesktopScreenshotService::DesktopScreenshotService(const std::string& screenshotsDirectory)
    : m_screenshotsDirectory(screenshotsDirectory) {
    if (!utils::FileUtils::createDirectoryIfNotExists(m_screenshotsDirectory)) {
        SLOG_WARNING().message("Could not create screenshots directory")
            .context("directory", m_screenshotsDirectory);
    }
}

DesktopScreenshotService::~DesktopScreenshotService() = default;

DesktopScreenshotService::DisplayConnection& DesktopScreenshotService::connection() {
    if (!m_display) {
        m_display = std::make_unique<DisplayConnection>();
        SLOG_DEBUG().message("Display connection opened")
            .context("width", m_display->width)
            .context("height", m_display->height);
    }
    return *m_display;
}

ImageBytes DesktopScreenshotService::captureArea(const ScreenRegion& area) {
    SCOPED_TIMER("screen_capture");
    cv::Mat image = connection().grab(area);
    return encodePng(image);
}

ImageBytes DesktopScreenshotService::captureFullScreen() {
    std::lock_guard<std::mutex> lock(m_mutex);
    DisplayConnection& display = connection();
    return captureArea(ScreenRegion{0, 0, display.width, display.height});
}

ImageBytes DesktopScreenshotService::captureRegion(const ScreenRegion& region) {
    std::lock_guard<std::mutex> lock(m_mutex);
    DisplayConnection& display = connection();

    // Clip to the screen
    int left = std::max(region.x, 0);
    int top = std::max(region.y, 0);
    int right = std::min(region.x + region.width, display.width);
    int bottom = std::min(region.y + region.height, display.height);
    ScreenRegion clipped{left, top, right - left, bottom - top};

    if (region.isEmpty() || clipped.isEmpty()) {
        DESKPILOT_THROW(ErrorType::CAPTURE_ERROR, ErrorSeverity::LOW,
                        "Capture region is empty",
                        std::to_string(region.width) + "x" + std::to_string(region.height) +
                            " at " + std::to_string(region.x) + "," + std::to_string(region.y),
                        "DesktopScreenshotService::captureRegion");
    }
    return captureArea(clipped);
}

std::string DesktopScreenshotService::saveScreenshot(const ImageBytes& image, const std::string& fileName) {
    std::string name = fileName.empty() ? defaultScreenshotName() : fileName;
    if (!std::filesystem::path(name).has_extension()) {
        name += ".png";
    }

    std::string path = (std::filesystem::path(m_screenshotsDirectory) / name).string();
    if (!utils::FileUtils::writeBinaryFile(path, image)) {
        DESKPILOT_THROW(ErrorType::STORAGE_ERROR, ErrorSeverity::MEDIUM,
                        "Failed to save screenshot", path, "DesktopScreenshotService::saveScreenshot");
    }

    SLOG_INFO().message("Screenshot saved").context("path", path).context("bytes", image.size());
    return path;
}

ScreenRegion DesktopScreenshotService::getScreenBounds() {
    std::lock_guard<std::mutex> lock(m_mutex);
    DisplayConnection& display = connection();
    return ScreenRegion{0, 0, display.width, display.height};
}

TemplateImage DesktopScreenshotService::createTemplateImage(const ScreenRegion& region, const std::string& name) {
    TemplateImage image;
    image.id = generateId();
    image.name = name;
    image.imageData = captureRegion(region);
    image.createdAt = std::chrono::system_clock::now();
    image.captureRegion = region;
    image.matchThreshold = ConfigManager::getInstance().getDefaultMatchThreshold();
    return image;
}

} // namespace deskpilot
