#include "Application.hpp"
#include <QCommandLineParser>
#include <QPalette>
#include <QStyleFactory>
#include <utility>
#include "Config.hpp"
#include "Logger.hpp"
#include "audio/PlayerController.hpp"
#include "ui/MainWindow.hpp"

namespace babel {

Application* Application::instance_ = nullptr;

namespace {
void applyTheme(QApplication& app, const std::string& theme) {
    app.setStyle(QStyleFactory::create("Fusion"));
    if (theme != "dark")
        return;

    QPalette pal;
    pal.setColor(QPalette::Window, QColor(0x1F, 0x29, 0x37));
    pal.setColor(QPalette::WindowText, QColor(0xE5, 0xE7, 0xEB));
    pal.setColor(QPalette::Base, QColor(0x11, 0x18, 0x27));
    pal.setColor(QPalette::AlternateBase, QColor(0x1F, 0x29, 0x37));
    pal.setColor(QPalette::Text, QColor(0xE5, 0xE7, 0xEB));
    pal.setColor(QPalette::Button, QColor(0x37, 0x41, 0x51));
    pal.setColor(QPalette::ButtonText, QColor(0xE5, 0xE7, 0xEB));
    pal.setColor(QPalette::Highlight, QColor(0xF9, 0x73, 0x16));
    pal.setColor(QPalette::HighlightedText, Qt::black);
    pal.setColor(QPalette::ToolTipBase, QColor(0x11, 0x18, 0x27));
    pal.setColor(QPalette::ToolTipText, QColor(0xE5, 0xE7, 0xEB));
    pal.setColor(QPalette::Disabled, QPalette::Text, QColor(0x6B, 0x72, 0x80));
    pal.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(0x6B, 0x72, 0x80));
    app.setPalette(pal);
}
} // namespace

Application::Application(int& argc, char** argv)
    : qapp_(std::make_unique<QApplication>(argc, argv)) {
    instance_ = this;
    QApplication::setApplicationName("babel-player");
    QApplication::setApplicationDisplayName("Babel Player");
    QApplication::setApplicationVersion("0.1.0");
}

Application::~Application() {
    mainWindow_.reset();
    player_.reset();
    Logger::shutdown();
    instance_ = nullptr;
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Music player with word-by-word synchronized lyric translation");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption debugOpt("debug", "Enable debug logging.");
    QCommandLineOption configOpt(
            {"c", "config"}, "Use configuration <file>.", "file");
    QCommandLineOption audioOpt(
            {"a", "audio"}, "Load audio <file> on start.", "file");
    QCommandLineOption lyricsOpt(
            {"l", "lyrics"}, "Load Babel lyrics JSON <file> on start.", "file");
    QCommandLineOption ttmlOpt(
            {"t", "ttml"}, "Import AMLL TTML <file> into the editor.", "file");
    parser.addOptions({debugOpt, configOpt, audioOpt, lyricsOpt, ttmlOpt});

    // parse() instead of process() so unknown options come back as errors
    if (!parser.parse(QApplication::arguments()))
        return Result<AppOptions>::err(parser.errorText().toStdString());

    if (parser.isSet("help"))
        parser.showHelp(0);
    if (parser.isSet("version"))
        parser.showVersion();

    if (!parser.positionalArguments().isEmpty()) {
        return Result<AppOptions>::err(
                "Unexpected argument: " +
                parser.positionalArguments().first().toStdString());
    }

    auto pathOf = [&parser](const QCommandLineOption& opt)
            -> std::optional<std::filesystem::path> {
        if (!parser.isSet(opt))
            return std::nullopt;
        return std::filesystem::path(parser.value(opt).toStdString());
    };

    AppOptions opts;
    opts.debug = parser.isSet(debugOpt);
    opts.configPath = pathOf(configOpt);
    opts.audioFile = pathOf(audioOpt);
    opts.lyricsFile = pathOf(lyricsOpt);
    opts.ttmlFile = pathOf(ttmlOpt);
    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("babel-player", opts.debug);

    auto cfgResult = opts.configPath ? CONFIG.load(*opts.configPath)
                                     : CONFIG.loadDefault();
    if (!cfgResult) {
        LOG_ERROR("{}", cfgResult.error().message);
        LOG_WARN("Continuing with built-in defaults");
        CONFIG.resetToDefaults();
    }
    if (opts.debug || CONFIG.debug())
        Logger::setDebug(true);

    applyTheme(*qapp_, std::as_const(CONFIG).ui().theme);

    auto audioPlayer = std::make_unique<AudioPlayer>();
    if (auto res = audioPlayer->init(std::as_const(CONFIG).audio()); !res) {
        LOG_ERROR("{}", res.error().message);
        LOG_WARN("Audio output unavailable, playback will be silent");
    }
    player_ = std::make_unique<PlayerController>(std::move(audioPlayer));

    mainWindow_ = std::make_unique<MainWindow>(player_.get());
    mainWindow_->show();

    if (opts.audioFile)
        mainWindow_->openAudio(*opts.audioFile);
    if (opts.lyricsFile)
        mainWindow_->openLyrics(*opts.lyricsFile);
    if (opts.ttmlFile)
        mainWindow_->importTtml(*opts.ttmlFile);

    LOG_INFO("Babel Player started");
    return Result<void>::ok();
}

int Application::exec() {
    return qapp_->exec();
}

} // namespace babel
