#pragma once

#include <optional>
#include <string>
#include <vector>

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Window/Event.hpp>
#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/Text.hpp>

#include "CaseFile.h"
#include "Diagnostics.h"
#include "Settings.h"
#include "TuringMachine.h"

enum class AppMode {
    Idle,        // Машина не подготовлена
    Ready,       // Вход загружен на ленту
    Running,
    Paused,
    Halted,
    InputError   // Строка примера не разобрана
};

/** @brief Операция над сообщением */
enum class CipherOperation { Encrypt, Decrypt };

/** @brief Откуда взята строка примера */
enum class CaseSource { EncryptFile, DecryptFile, Manual };

class App {
public:
    explicit App(AppSettings settings);

    /**
     * @brief Обработать событие SFML (ввод пользователя)
     * @param event Событие (нажатие клавиши, клик мыши и т.д.)
     * @param window Окно для закрытия при необходимости
     */
    void handleEvent(const sf::Event& event, sf::RenderWindow& window);

    /**
     * @brief Обновить состояние приложения
     *
     * В режиме Running выполняет settings.stepsPerFrame шагов машины.
     */
    void update(float dt);

    /** @brief Отрисовать весь интерфейс */
    void render(sf::RenderWindow& window);

    // ============================================================
    // Команды пользователя (клавиши или кнопки)
    // ============================================================

    /** @brief Построить машину шифрования для выбранного примера */
    void requestEncrypt();

    /** @brief Построить машину дешифрования для выбранного примера */
    void requestDecrypt();

    /** @brief Выполнить один шаг машины Тьюринга */
    void requestStep();

    /** @brief Запустить автоматическое выполнение */
    void requestRun();

    /** @brief Приостановить автоматическое выполнение */
    void requestPause();

    /** @brief Заново загрузить сообщение на ленту */
    void requestReset();

    /** @brief Ввод символа в строку ручного ввода (кодируется в UTF-8) */
    void handleInputText(char32_t unicode);

    /** @brief Переключить фокус между списком примеров и ручным вводом */
    void toggleInputFocus();

    /** @brief Выбрать пример из списка (ручной ввод теряет фокус) */
    void selectCase(std::size_t index);

    // Текущее состояние (для панели статуса и тестов)

    AppMode mode() const { return mode_; }
    bool hasMachine() const { return tm_.has_value(); }
    const TuringMachine* machine() const { return tm_ ? &*tm_ : nullptr; }
    std::size_t caseCount() const { return cases_.size(); }
    const std::string& manualInput() const { return manualInput_; }
    const std::string& result() const { return result_; }
    const std::string& statusMessage() const { return statusMessage_; }

private:
    /** @brief Прямоугольная область экрана */
    struct Region {
        sf::Vector2f pos;
        sf::Vector2f size;
    };

    /** @brief Раскладка всех областей интерфейса */
    struct Layout {
        Region cases;
        Region input;
        Region tape;
        Region controls;
        Region info;
        Region table;
    };

    /** @brief Описание кнопки управления */
    struct ControlButtonSpec {
        sf::FloatRect rect;
        std::string label;
        bool enabled{true};
    };

    /** @brief Строка списка примеров */
    struct CaseEntry {
        std::string text;
        CaseSource source;
    };

    // Отрисовка

    Layout computeLayout(const sf::Vector2u& size) const;
    void renderCases(sf::RenderWindow& window, const Layout& layout);
    void renderInput(sf::RenderWindow& window, const Layout& layout);
    void renderTape(sf::RenderWindow& window, const Layout& layout);
    void renderControls(sf::RenderWindow& window, const Layout& layout);
    void renderInfo(sf::RenderWindow& window, const Layout& layout);
    void renderTable(sf::RenderWindow& window, const Layout& layout);

    // Обработка ввода

    /** @brief Служебные клавиши (без Ctrl) */
    void handleNavigationKey(const sf::Event::KeyPressed& key);

    /** @brief Клик по списку примеров */
    void handleCasesClick(const sf::Vector2f& pos, const Layout& layout);

    /** @brief Клик по панели управления */
    void handleControlClick(const sf::Vector2f& pos, const Layout& layout);

    std::vector<ControlButtonSpec> buildControlButtons(const Layout& layout) const;

    // Работа с машиной

    /** @brief Разобрать выбранный пример и загрузить сообщение на ленту */
    void prepare(CipherOperation operation);

    /** @brief Отклонить вход: диагностика в статус, машина сбрасывается */
    void rejectInput(const std::vector<Diagnostic>& diags);

    /** @brief Зафиксировать остановку: результат, файл, консоль */
    void finishRun(HaltReason reason);

    /** @brief Перечитать файлы примеров */
    void reloadCases();

    // Вспомогательные методы

    void scrollTape(int deltaCells);
    void ensureTapeHeadVisible();
    void clampTapeOffset();
    std::size_t tableRowCount() const;
    void clampCaseScroll(std::size_t visibleRows);

    // ============================================================
    // Состояние приложения
    // ============================================================

    AppSettings settings_;

    sf::Font font_;
    bool fontLoaded_{false};
    float lineHeight_{18.f};

    // Примеры
    std::vector<CaseEntry> cases_;
    std::size_t selectedCase_{0};
    std::size_t firstVisibleCase_{0};
    std::size_t casesVisibleRows_{10};

    // Ручной ввод КЛЮЧ#СООБЩЕНИЕ
    bool inputFocused_{false};
    std::string manualInput_;
    std::size_t manualCursor_{0};

    // Текущий прогон
    std::optional<TuringMachine> tm_;
    AppMode mode_{AppMode::Idle};
    CipherOperation operation_{CipherOperation::Encrypt};
    CaseSource source_{CaseSource::EncryptFile};
    CipherCase case_{};
    std::string inputLine_;
    int machineShift_{0};
    std::string expected_;
    std::string result_;
    HaltReason haltReason_{HaltReason::Running};
    std::string statusMessage_;

    // Параметры отображения ленты
    long long tapeOffset_{-2};
    std::size_t tapeVisibleCells_{16};
    float tapeCellWidth_{56.f};
    float tapeCellHeight_{64.f};
    float tapePadding_{8.f};

    // Параметры отображения таблицы переходов
    std::size_t firstVisibleTransitionRow_{0};
    float tableRowHeight_{22.f};
    float tableColWidth_{170.f};
};
