#pragma once
// Application.hpp - Process setup: Qt app, command line, config, logging

#include <QApplication>
#include <filesystem>
#include <memory>
#include <optional>
#include "util/Result.hpp"

namespace babel {

class PlayerController;
class MainWindow;

struct AppOptions {
    bool debug{false};
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> audioFile;
    std::optional<std::filesystem::path> lyricsFile;
    std::optional<std::filesystem::path> ttmlFile;
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    static Application* instance() {
        return instance_;
    }

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

    PlayerController* player() {
        return player_.get();
    }

private:
    static Application* instance_;

    std::unique_ptr<QApplication> qapp_;
    std::unique_ptr<PlayerController> player_;
    std::unique_ptr<MainWindow> mainWindow_;
};

#define APP babel::Application::instance()

} // namespace babel
