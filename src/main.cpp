#include <iostream>
#include <optional>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "App.h"
#include "Diagnostics.h"
#include "Settings.h"

static void setupConsoleUtf8() {
#ifdef _WIN32
    if (GetConsoleWindow() == nullptr) {
        return;
    }

    // Диагностика настроек печатается в UTF-8
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif
}

int main() {
    setupConsoleUtf8();

    // Ошибки в settings.txt не фатальны: неверные значения остаются по умолчанию
    AppSettings settings;
    std::vector<Diagnostic> diags;
    if (!loadSettings(kSettingsFile, settings, diags)) {
        std::cout << "Settings file contains errors, defaults are used for them" << std::endl;
    }
    printDiagnostics(std::cout, kSettingsFile, diags);

    const auto desktop = sf::VideoMode::getDesktopMode();
    const auto state = settings.fullscreen ? sf::State::Fullscreen : sf::State::Windowed;
    sf::RenderWindow window(desktop, "Caesar Cipher Turing Machine", sf::Style::Default, state);

    window.setFramerateLimit(60);

    App app(settings);

    sf::Clock clock;

    while (window.isOpen()) {
        while (const std::optional event = window.pollEvent()) {
            app.handleEvent(*event, window);
        }

        const float dt = clock.restart().asSeconds();
        app.update(dt);

        app.render(window);
    }

    return 0;
}
