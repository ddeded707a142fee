#include "App.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <utility>

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/RectangleShape.hpp>
#include <SFML/Graphics/View.hpp>
#include <SFML/System/String.hpp>
#include <SFML/System/Utf.hpp>

#include "CaesarCipher.h"
#include "Diagnostics.h"
#include "MachineDocument.h"

// Сдвиг машины, описание которой записывается при запуске (пример A+3=D)
static constexpr int kDocumentShift = 3;

// View, ограничивающий отрисовку прямоугольной областью окна
static sf::View makeClipView(const sf::Vector2f& pos, const sf::Vector2f& size, const sf::Vector2u& winSize) {
    sf::View view(sf::FloatRect{pos, size});
    view.setViewport(sf::FloatRect{
        sf::Vector2f{pos.x / static_cast<float>(winSize.x), pos.y / static_cast<float>(winSize.y)},
        sf::Vector2f{size.x / static_cast<float>(winSize.x), size.y / static_cast<float>(winSize.y)}});
    return view;
}

static std::string toUpperCopy(std::string str) {
    for (auto& c : str) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return str;
}

// Строки приложения (сообщения, примеры, ввод) хранятся в UTF-8
static sf::String fromUtf8(const std::string& str) {
    return sf::String::fromUtf8(str.begin(), str.end());
}

static bool isUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Начало предыдущего символа UTF-8 перед позицией pos
static std::size_t prevCharStart(const std::string& str, std::size_t pos) {
    if (pos == 0) {
        return 0;
    }
    pos--;
    while (pos > 0 && isUtf8Continuation(str[pos])) {
        pos--;
    }
    return pos;
}

// Начало следующего символа UTF-8 после позиции pos
static std::size_t nextCharStart(const std::string& str, std::size_t pos) {
    if (pos >= str.size()) {
        return str.size();
    }
    pos++;
    while (pos < str.size() && isUtf8Continuation(str[pos])) {
        pos++;
    }
    return pos;
}

static const char* operationName(CipherOperation operation) {
    return operation == CipherOperation::Encrypt ? "Encryption" : "Decryption";
}


App::App(AppSettings settings) : settings_(std::move(settings)) {
    fontLoaded_ = font_.openFromFile(settings_.fontPath);
    if (!fontLoaded_) {
        std::cout << "Error: cannot load font '" << settings_.fontPath << "'" << std::endl;
    }

    // Файлы примеров: шифрование создаётся при отсутствии, дешифрование пересобирается
    std::vector<Diagnostic> diags;
    createSampleFiles(settings_.encryptCasesFile, settings_.decryptCasesFile, diags);
    printDiagnostics(std::cout, "", diags);
    reloadCases();

    // Описание машины для документации
    diags.clear();
    if (saveResult(settings_.descriptionFile, describeCaesarMachine(kDocumentShift), diags)) {
        std::cout << "Machine description saved to: " << settings_.descriptionFile << std::endl;
    }
    printDiagnostics(std::cout, settings_.descriptionFile, diags);
}


void App::reloadCases() {
    cases_.clear();

    std::vector<Diagnostic> diags;
    for (auto& line : loadTestCases(settings_.encryptCasesFile, diags)) {
        cases_.push_back({std::move(line), CaseSource::EncryptFile});
    }
    printDiagnostics(std::cout, settings_.encryptCasesFile, diags);

    diags.clear();
    for (auto& line : loadTestCases(settings_.decryptCasesFile, diags)) {
        cases_.push_back({std::move(line), CaseSource::DecryptFile});
    }
    printDiagnostics(std::cout, settings_.decryptCasesFile, diags);

    selectedCase_ = 0;
    firstVisibleCase_ = 0;
    // Без примеров остаётся только ручной ввод
    inputFocused_ = cases_.empty();
}


App::Layout App::computeLayout(const sf::Vector2u& size) const {
    const float w = static_cast<float>(size.x);
    const float h = static_cast<float>(size.y);

    const float splitX = w * 0.4f;
    const float inputH = lineHeight_ * 3.f + 24.f;

    const float tapeH = std::max(tapeCellHeight_ + 64.f, h * 0.22f);
    const float controlH = std::max(48.f, h * 0.07f);
    const float infoH = lineHeight_ * 8.f + 16.f;
    const float tableH = std::max(80.f, h - tapeH - controlH - infoH);

    Layout layout{};
    layout.cases = {{0.f, 0.f}, {splitX, h - inputH}};
    layout.input = {{0.f, h - inputH}, {splitX, inputH}};
    layout.tape = {{splitX, 0.f}, {w - splitX, tapeH}};
    layout.controls = {{splitX, tapeH}, {w - splitX, controlH}};
    layout.info = {{splitX, tapeH + controlH}, {w - splitX, infoH}};
    layout.table = {{splitX, tapeH + controlH + infoH}, {w - splitX, tableH}};
    return layout;
}

void App::handleEvent(const sf::Event& event, sf::RenderWindow& window) {
    if (event.is<sf::Event::Closed>()) {
        window.close();
        return;
    }

    // Печатные символы идут только в строку ручного ввода
    if (const auto* text = event.getIf<sf::Event::TextEntered>()) {
        if (inputFocused_ && mode_ != AppMode::Running) {
            handleInputText(text->unicode);
        }
        return;
    }

    if (const auto* key = event.getIf<sf::Event::KeyPressed>()) {
        if (key->code == sf::Keyboard::Key::Escape) {
            window.close();
            return;
        }

        if (key->control) {
            switch (key->code) {
            case sf::Keyboard::Key::E:
                requestEncrypt();
                break;
            case sf::Keyboard::Key::D:
                requestDecrypt();
                break;
            case sf::Keyboard::Key::Space:
                requestStep();
                break;
            case sf::Keyboard::Key::P:
                if (mode_ == AppMode::Running) {
                    requestPause();
                } else {
                    requestRun();
                }
                break;
            case sf::Keyboard::Key::R:
                requestReset();
                break;
            default:
                break;
            }
            return;
        }

        handleNavigationKey(*key);
        return;
    }

    if (const auto* mouse = event.getIf<sf::Event::MouseButtonPressed>()) {
        if (mouse->button != sf::Mouse::Button::Left) {
            return;
        }
        const auto layout = computeLayout(window.getSize());
        const sf::Vector2f pos{static_cast<float>(mouse->position.x), static_cast<float>(mouse->position.y)};

        if (sf::FloatRect(layout.controls.pos, layout.controls.size).contains(pos)) {
            handleControlClick(pos, layout);
        } else if (sf::FloatRect(layout.cases.pos, layout.cases.size).contains(pos)) {
            handleCasesClick(pos, layout);
        } else if (sf::FloatRect(layout.input.pos, layout.input.size).contains(pos)) {
            inputFocused_ = true;
        }
        return;
    }

    if (const auto* wheel = event.getIf<sf::Event::MouseWheelScrolled>()) {
        const auto layout = computeLayout(window.getSize());
        const sf::Vector2f pos{static_cast<float>(wheel->position.x), static_cast<float>(wheel->position.y)};

        if (sf::FloatRect(layout.cases.pos, layout.cases.size).contains(pos)) {
            if (wheel->delta < 0) {
                firstVisibleCase_++;
            } else if (wheel->delta > 0 && firstVisibleCase_ > 0) {
                firstVisibleCase_--;
            }
            clampCaseScroll(casesVisibleRows_);
        } else if (sf::FloatRect(layout.tape.pos, layout.tape.size).contains(pos)) {
            scrollTape(wheel->delta > 0 ? -1 : 1);
        } else if (sf::FloatRect(layout.table.pos, layout.table.size).contains(pos)) {
            const float headerH = 28.f;
            const float maxVisibleF = (layout.table.size.y - headerH - 16.f) / tableRowHeight_;
            const std::size_t maxVisible = static_cast<std::size_t>(std::max(1.f, std::floor(maxVisibleF)));
            if (wheel->delta < 0 && firstVisibleTransitionRow_ + maxVisible < tableRowCount()) {
                firstVisibleTransitionRow_++;
            } else if (wheel->delta > 0 && firstVisibleTransitionRow_ > 0) {
                firstVisibleTransitionRow_--;
            }
        }
    }
}


void App::update(float) {
    if (mode_ != AppMode::Running) {
        return;
    }
    for (std::uint64_t i = 0; i < settings_.stepsPerFrame && mode_ == AppMode::Running; i++) {
        requestStep();
    }
}


void App::render(sf::RenderWindow& window) {
    const auto layout = computeLayout(window.getSize());

    auto background = [&](const Region& region, const sf::Color& color) {
        sf::RectangleShape bg;
        bg.setPosition(region.pos);
        bg.setSize(region.size);
        bg.setFillColor(color);
        window.draw(bg);
    };

    window.clear(sf::Color(25, 25, 30));

    background(layout.cases, sf::Color(35, 35, 45));
    renderCases(window, layout);

    background(layout.input, inputFocused_ ? sf::Color(45, 45, 65) : sf::Color(40, 40, 50));
    renderInput(window, layout);

    background(layout.tape, sf::Color(45, 55, 70));
    renderTape(window, layout);

    background(layout.controls, sf::Color(60, 55, 75));
    renderControls(window, layout);

    background(layout.info, sf::Color(40, 48, 58));
    renderInfo(window, layout);

    background(layout.table, sf::Color(50, 45, 60));
    renderTable(window, layout);

    window.display();
}


// renderCases - Список примеров из обоих файлов
void App::renderCases(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = 8.f;
    const float headerH = 28.f;
    const float rowH = lineHeight_ + 6.f;

    const float listH = layout.cases.size.y - headerH - padding * 2.f;
    casesVisibleRows_ = static_cast<std::size_t>(std::max(1.f, std::floor(listH / rowH)));
    clampCaseScroll(casesVisibleRows_);

    const auto prevView = window.getView();
    window.setView(makeClipView(layout.cases.pos, layout.cases.size, window.getSize()));

    sf::Text text(font_, "", static_cast<unsigned>(lineHeight_));
    text.setFillColor(sf::Color(220, 220, 230));
    text.setStyle(sf::Text::Bold);
    text.setString("Test cases  (E = encryption file, D = decryption file)");
    text.setPosition({layout.cases.pos.x + padding, layout.cases.pos.y + padding});
    window.draw(text);
    text.setStyle(sf::Text::Regular);

    if (cases_.empty()) {
        text.setString("No cases loaded");
        text.setPosition({layout.cases.pos.x + padding, layout.cases.pos.y + padding + headerH});
        window.draw(text);
        window.setView(prevView);
        return;
    }

    const std::size_t endRow = std::min(cases_.size(), firstVisibleCase_ + casesVisibleRows_);
    float y = layout.cases.pos.y + padding + headerH;
    for (std::size_t i = firstVisibleCase_; i < endRow; i++) {
        const bool selected = (i == selectedCase_) && !inputFocused_;

        sf::RectangleShape rowBg;
        rowBg.setPosition({layout.cases.pos.x, y});
        rowBg.setSize({layout.cases.size.x, rowH});
        if (selected) {
            rowBg.setFillColor(sf::Color(200, 120, 60));
        } else {
            rowBg.setFillColor((i % 2) == 0 ? sf::Color(45, 45, 58) : sf::Color(40, 40, 52));
        }
        window.draw(rowBg);

        const char tag = cases_[i].source == CaseSource::EncryptFile ? 'E' : 'D';
        text.setString(fromUtf8(std::string(1, tag) + " [" + std::to_string(i + 1) + "] " + cases_[i].text));
        text.setPosition({layout.cases.pos.x + padding, y + 3.f});
        window.draw(text);
        y += rowH;
    }

    // Вертикальный скроллбар
    if (cases_.size() > casesVisibleRows_) {
        const float sbW = 8.f;
        const float sbX = layout.cases.pos.x + layout.cases.size.x - sbW;
        const float sbY = layout.cases.pos.y + headerH + padding;
        const float sbH = listH;

        sf::RectangleShape track;
        track.setPosition({sbX, sbY});
        track.setSize({sbW, sbH});
        track.setFillColor(sf::Color(60, 60, 70));
        window.draw(track);

        const float ratio = static_cast<float>(casesVisibleRows_) / static_cast<float>(cases_.size());
        const float thumbH = std::max(20.f, sbH * ratio);
        const float maxScroll = static_cast<float>(cases_.size() - casesVisibleRows_);
        const float t = static_cast<float>(firstVisibleCase_) / maxScroll;

        sf::RectangleShape thumb;
        thumb.setPosition({sbX, sbY + t * (sbH - thumbH)});
        thumb.setSize({sbW, thumbH});
        thumb.setFillColor(sf::Color(180, 180, 200));
        window.draw(thumb);
    }

    window.setView(prevView);
}


// renderInput - Строка ручного ввода КЛЮЧ#СООБЩЕНИЕ
void App::renderInput(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = 8.f;
    sf::Text text(font_, "", static_cast<unsigned>(lineHeight_));
    text.setFillColor(sf::Color(200, 200, 210));
    text.setString("Manual input (KEY#MESSAGE, e.g. 3#HOLA MUNDO or D#HOLA MUNDO):");
    text.setPosition({layout.input.pos.x + padding, layout.input.pos.y + padding});
    window.draw(text);

    const float boxY = layout.input.pos.y + padding * 2.f + lineHeight_;
    const float boxH = lineHeight_ + 10.f;
    sf::RectangleShape box;
    box.setPosition({layout.input.pos.x + padding, boxY});
    box.setSize({layout.input.size.x - padding * 2.f, boxH});
    box.setFillColor(sf::Color(30, 30, 38));
    box.setOutlineThickness(1.f);
    box.setOutlineColor(inputFocused_ ? sf::Color(200, 120, 60) : sf::Color(70, 70, 85));
    window.draw(box);

    const auto prevView = window.getView();
    window.setView(makeClipView(box.getPosition(), box.getSize(), window.getSize()));

    text.setFillColor(sf::Color(230, 230, 240));
    text.setString(fromUtf8(manualInput_));
    text.setPosition({layout.input.pos.x + padding * 2.f, boxY + 4.f});
    window.draw(text);

    if (inputFocused_) {
        text.setString(fromUtf8(manualInput_.substr(0, manualCursor_)));
        const float caretX = layout.input.pos.x + padding * 2.f + text.getLocalBounds().size.x;
        sf::RectangleShape caret;
        caret.setFillColor(sf::Color(200, 200, 255));
        caret.setPosition({caretX, boxY + 4.f});
        caret.setSize({2.f, lineHeight_});
        window.draw(caret);
    }

    window.setView(prevView);
}


void App::handleInputText(char32_t unicode) {
    // Управляющие символы не вводятся; остальное кодируется в UTF-8
    if (unicode < 32 || unicode == 127) {
        return;
    }
    std::string bytes;
    sf::Utf8::encode(unicode, std::back_inserter(bytes));
    manualInput_.insert(manualCursor_, bytes);
    manualCursor_ += bytes.size();
}


void App::handleNavigationKey(const sf::Event::KeyPressed& key) {
    if (key.code == sf::Keyboard::Key::Tab) {
        toggleInputFocus();
        return;
    }

    if (inputFocused_) {
        if (mode_ == AppMode::Running) {
            return;
        }
        switch (key.code) {
        case sf::Keyboard::Key::Backspace: {
            const std::size_t from = prevCharStart(manualInput_, manualCursor_);
            manualInput_.erase(from, manualCursor_ - from);
            manualCursor_ = from;
            break;
        }
        case sf::Keyboard::Key::Delete:
            manualInput_.erase(manualCursor_, nextCharStart(manualInput_, manualCursor_) - manualCursor_);
            break;
        case sf::Keyboard::Key::Left:
            manualCursor_ = prevCharStart(manualInput_, manualCursor_);
            break;
        case sf::Keyboard::Key::Right:
            manualCursor_ = nextCharStart(manualInput_, manualCursor_);
            break;
        case sf::Keyboard::Key::Home:
            manualCursor_ = 0;
            break;
        case sf::Keyboard::Key::End:
            manualCursor_ = manualInput_.size();
            break;
        case sf::Keyboard::Key::Enter:
            requestEncrypt();
            break;
        default:
            break;
        }
        return;
    }

    // Навигация по списку примеров
    switch (key.code) {
    case sf::Keyboard::Key::Up:
        if (selectedCase_ > 0) {
            selectCase(selectedCase_ - 1);
        }
        break;
    case sf::Keyboard::Key::Down:
        selectCase(selectedCase_ + 1);
        break;
    case sf::Keyboard::Key::Enter:
        if (!cases_.empty()) {
            if (cases_[selectedCase_].source == CaseSource::DecryptFile) {
                requestDecrypt();
            } else {
                requestEncrypt();
            }
        }
        return;
    default:
        break;
    }
}


void App::toggleInputFocus() {
    inputFocused_ = !inputFocused_ || cases_.empty();
}


void App::selectCase(std::size_t index) {
    if (index >= cases_.size()) {
        return;
    }
    selectedCase_ = index;
    inputFocused_ = false;
    // Выделенная строка должна оставаться видимой
    if (selectedCase_ < firstVisibleCase_) {
        firstVisibleCase_ = selectedCase_;
    } else if (selectedCase_ >= firstVisibleCase_ + casesVisibleRows_) {
        firstVisibleCase_ = selectedCase_ + 1 - casesVisibleRows_;
    }
}


void App::handleCasesClick(const sf::Vector2f& pos, const Layout& layout) {
    const float padding = 8.f;
    const float headerH = 28.f;
    const float rowH = lineHeight_ + 6.f;

    const float rel = pos.y - (layout.cases.pos.y + padding + headerH);
    if (rel < 0.f) {
        return;
    }
    selectCase(firstVisibleCase_ + static_cast<std::size_t>(rel / rowH));
}


void App::clampCaseScroll(std::size_t visibleRows) {
    if (cases_.size() <= visibleRows) {
        firstVisibleCase_ = 0;
        return;
    }
    firstVisibleCase_ = std::min(firstVisibleCase_, cases_.size() - visibleRows);
}


// scrollTape - Прокрутка ленты
void App::scrollTape(int deltaCells) {
    tapeOffset_ += deltaCells;
    clampTapeOffset();
}

// ensureTapeHeadVisible - Головка всегда в видимой области
void App::ensureTapeHeadVisible() {
    if (!hasMachine()) {
        return;
    }
    const long long headPos = static_cast<long long>(tm_->head());
    if (headPos < tapeOffset_) {
        tapeOffset_ = headPos - 1;
    } else if (headPos >= tapeOffset_ + static_cast<long long>(tapeVisibleCells_)) {
        tapeOffset_ = headPos - static_cast<long long>(tapeVisibleCells_ / 2);
    }
    clampTapeOffset();
}

// clampTapeOffset - Смещение в пределах ленты с небольшим отступом по краям
void App::clampTapeOffset() {
    const long long margin = 2;
    const long long tapeSize = hasMachine() ? static_cast<long long>(tm_->tape().size()) : 0;

    const long long minOffset = -margin;
    long long maxOffset = tapeSize + margin - static_cast<long long>(tapeVisibleCells_);
    if (maxOffset < minOffset) {
        maxOffset = minOffset;
    }
    tapeOffset_ = std::clamp(tapeOffset_, minOffset, maxOffset);
}


// renderTape - Отрисовка ленты машины Тьюринга
void App::renderTape(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = tapePadding_;
    const float cellW = tapeCellWidth_;
    const float cellH = tapeCellHeight_;

    tapeVisibleCells_ = static_cast<std::size_t>(std::max(1.f, std::floor((layout.tape.size.x - 2.f * padding) / cellW)));
    clampTapeOffset();

    sf::Text cellText(font_, "", static_cast<unsigned>(cellH * 0.5f));
    sf::Text idxText(font_, "", static_cast<unsigned>(cellH * 0.25f));
    idxText.setFillColor(sf::Color(200, 200, 210));

    const float startX = layout.tape.pos.x + padding;
    const float startY = layout.tape.pos.y + padding;

    for (std::size_t i = 0; i < tapeVisibleCells_; i++) {
        const long long cellIndex = tapeOffset_ + static_cast<long long>(i);
        const bool inside = hasMachine() && cellIndex >= 0 &&
                            cellIndex < static_cast<long long>(tm_->tape().size());
        const Symbol sym = hasMachine() ? tm_->tape().get(cellIndex) : kBlank;
        const bool isHead = hasMachine() && cellIndex == static_cast<long long>(tm_->head());

        const float x = startX + static_cast<float>(i) * cellW;

        sf::RectangleShape box;
        box.setPosition({x, startY});
        box.setSize({cellW - 4.f, cellH});
        if (isHead) {
            box.setFillColor(sf::Color(200, 120, 60));
        } else {
            // Ячейки за пределами физической ленты темнее
            box.setFillColor(inside ? sf::Color(70, 80, 100) : sf::Color(55, 62, 78));
        }
        box.setOutlineThickness(1.f);
        box.setOutlineColor(sf::Color(30, 30, 40));
        window.draw(box);

        // Байт вне ASCII показывается кодом мельче основного шрифта
        const std::string label = sym == ' ' ? std::string(" ") : displaySymbol(sym);
        cellText.setCharacterSize(static_cast<unsigned>(label.size() > 1 ? cellH * 0.22f : cellH * 0.5f));
        cellText.setString(label);
        cellText.setFillColor(sym == kBlank ? sf::Color(140, 140, 160) : sf::Color(230, 230, 230));
        const sf::FloatRect bounds = cellText.getLocalBounds();
        cellText.setPosition({x + (cellW - bounds.size.x) * 0.5f - bounds.position.x,
                              startY + (cellH - bounds.size.y) * 0.5f - bounds.position.y});
        window.draw(cellText);

        idxText.setString(std::to_string(cellIndex));
        const auto b = idxText.getLocalBounds();
        idxText.setPosition({x + (cellW - b.size.x) * 0.5f - b.position.x, startY + cellH + 10.f});
        window.draw(idxText);
    }

    // Разделительная линия под ячейками
    sf::RectangleShape marker;
    marker.setPosition({startX, startY + cellH + 4.f});
    marker.setSize({layout.tape.size.x - 2.f * padding, 2.f});
    marker.setFillColor(sf::Color(100, 120, 160));
    window.draw(marker);

    // Горизонтальный скроллбар
    const float trackH = 8.f;
    const float trackY = layout.tape.pos.y + layout.tape.size.y - trackH - 4.f;
    const float trackW = layout.tape.size.x - 2.f * padding;

    sf::RectangleShape track;
    track.setPosition({startX, trackY});
    track.setSize({trackW, trackH});
    track.setFillColor(sf::Color(60, 60, 70));
    window.draw(track);

    const long long span = (hasMachine() ? static_cast<long long>(tm_->tape().size()) : 0) + 4;
    const float thumbRatio = static_cast<float>(tapeVisibleCells_) / static_cast<float>(span);
    const float thumbW = std::max(24.f, trackW * std::min(1.f, thumbRatio));
    const float denom = static_cast<float>(std::max<long long>(1, span - static_cast<long long>(tapeVisibleCells_)));
    const float t = std::clamp(static_cast<float>(tapeOffset_ + 2) / denom, 0.f, 1.f);

    sf::RectangleShape thumb;
    thumb.setPosition({startX + t * (trackW - thumbW), trackY});
    thumb.setSize({thumbW, trackH});
    thumb.setFillColor(sf::Color(180, 180, 200));
    window.draw(thumb);
}


// buildControlButtons - Кнопки в зависимости от режима
std::vector<App::ControlButtonSpec> App::buildControlButtons(const Layout& layout) const {
    const float padding = 8.f;
    const float spacing = 8.f;
    const float btnW = 96.f;
    const float btnH = 32.f;
    float x = layout.controls.pos.x + padding;
    const float y = layout.controls.pos.y + padding;

    std::vector<ControlButtonSpec> out;
    out.reserve(5);

    auto push = [&](std::string label, bool enabled) {
        ControlButtonSpec spec{};
        spec.rect = sf::FloatRect{sf::Vector2f{x, y}, sf::Vector2f{btnW, btnH}};
        spec.label = std::move(label);
        spec.enabled = enabled;
        out.push_back(std::move(spec));
        x += btnW + spacing;
    };

    const bool running = (mode_ == AppMode::Running);
    const bool halted = (mode_ == AppMode::Halted);

    push("Encrypt", !running);
    push("Decrypt", !running);
    push("Step", hasMachine() && !running && !halted);
    push(running ? "Pause" : "Run", hasMachine());
    push("Reset", hasMachine() && !running);
    return out;
}


void App::handleControlClick(const sf::Vector2f& pos, const Layout& layout) {
    const auto buttons = buildControlButtons(layout);
    for (std::size_t i = 0; i < buttons.size(); i++) {
        if (!buttons[i].enabled || !buttons[i].rect.contains(pos)) {
            continue;
        }

        switch (i) {
        case 0:
            requestEncrypt();
            return;
        case 1:
            requestDecrypt();
            return;
        case 2:
            requestStep();
            return;
        case 3:
            if (mode_ == AppMode::Running) {
                requestPause();
            } else {
                requestRun();
            }
            return;
        case 4:
            requestReset();
            return;
        default:
            break;
        }
    }
}


// renderControls - Кнопки и режим справа
void App::renderControls(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = 8.f;
    sf::Text text(font_, "", static_cast<unsigned>(lineHeight_));
    text.setFillColor(sf::Color(230, 230, 240));

    for (const auto& btn : buildControlButtons(layout)) {
        sf::RectangleShape box;
        box.setPosition(btn.rect.position);
        box.setSize(btn.rect.size);

        const bool isRun = (btn.label == "Run");
        const bool isPause = (btn.label == "Pause");
        const sf::Color base = isRun ? sf::Color(70, 120, 90) : (isPause ? sf::Color(140, 110, 70) : sf::Color(80, 90, 110));
        box.setFillColor(btn.enabled ? base : sf::Color(60, 60, 70));
        box.setOutlineThickness(1.f);
        box.setOutlineColor(sf::Color(30, 30, 40));
        window.draw(box);

        text.setString(btn.label);
        const auto bounds = text.getLocalBounds();
        text.setPosition({btn.rect.position.x + (btn.rect.size.x - bounds.size.x) * 0.5f - bounds.position.x,
                          btn.rect.position.y + (btn.rect.size.y - bounds.size.y) * 0.5f - bounds.position.y});
        window.draw(text);
    }

    std::string modeStr = "Mode: ";
    switch (mode_) {
    case AppMode::Idle: modeStr += "Idle"; break;
    case AppMode::Ready: modeStr += "Ready"; break;
    case AppMode::Running: modeStr += "Running"; break;
    case AppMode::Paused: modeStr += "Paused"; break;
    case AppMode::Halted: modeStr += "Halted"; break;
    case AppMode::InputError: modeStr += "Input Error"; break;
    }

    text.setString(modeStr);
    const auto bounds = text.getLocalBounds();
    text.setPosition({layout.controls.pos.x + layout.controls.size.x - padding - bounds.size.x - bounds.position.x,
                      layout.controls.pos.y + padding - bounds.position.y});
    window.draw(text);
}


// renderInfo - Сведения о текущем прогоне
void App::renderInfo(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = 8.f;
    const auto prevView = window.getView();
    window.setView(makeClipView(layout.info.pos, layout.info.size, window.getSize()));

    std::vector<std::string> lines;
    if (hasMachine()) {
        lines.push_back(std::string("Operation: ") + operationName(operation_) +
                        (source_ == CaseSource::Manual ? "  (manual input)" : ""));
        lines.push_back("Input:     " + inputLine_);
        lines.push_back("Key:       " + case_.keyText + " (shift = " + std::to_string(case_.shift) +
                        ", machine shift = " + std::to_string(machineShift_) + ")");
        lines.push_back("State:     " + tm_->state() + "   head = " + std::to_string(tm_->head()) +
                        "   steps = " + std::to_string(tm_->steps()) + " / " + std::to_string(settings_.maxSteps));
        lines.push_back(std::string("Halt:      ") + haltReasonName(haltReason_));
        lines.push_back("Tape:      " + tm_->getTapeContent());
        if (mode_ == AppMode::Halted) {
            lines.push_back("Expected:  " + expected_ + (result_ == expected_ ? "   [match]" : "   [MISMATCH]"));
        }
    } else {
        lines.push_back("Select a case and press Encrypt (Ctrl+E) or Decrypt (Ctrl+D).");
        lines.push_back("Step: Ctrl+Space   Run/Pause: Ctrl+P   Reset: Ctrl+R   Tab: manual input");
    }
    if (!statusMessage_.empty()) {
        lines.push_back(statusMessage_);
    }

    sf::Text text(font_, "", static_cast<unsigned>(lineHeight_));
    float y = layout.info.pos.y + padding;
    for (std::size_t i = 0; i < lines.size(); i++) {
        const bool isStatus = !statusMessage_.empty() && i + 1 == lines.size();
        text.setFillColor(isStatus ? sf::Color(230, 180, 120) : sf::Color(220, 220, 230));
        text.setString(fromUtf8(lines[i]));
        text.setPosition({layout.info.pos.x + padding, y});
        window.draw(text);
        y += lineHeight_ + 2.f;
    }

    window.setView(prevView);
}


std::size_t App::tableRowCount() const {
    return hasMachine() ? tm_->spec().tapeAlphabet.size() : 0;
}


// renderTable - Таблица переходов: строки - символы ленты, столбцы - состояния
void App::renderTable(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const auto prevView = window.getView();
    window.setView(makeClipView(layout.table.pos, layout.table.size, window.getSize()));

    const float padding = 8.f;
    const float headerH = 28.f;
    const float vScrollbarW = 8.f;
    const float colW = tableColWidth_;

    sf::Text text(font_, "", static_cast<unsigned>(lineHeight_));
    text.setFillColor(sf::Color(220, 220, 230));

    if (!hasMachine()) {
        text.setString("No machine");
        text.setPosition({layout.table.pos.x + padding, layout.table.pos.y + padding});
        window.draw(text);
        window.setView(prevView);
        return;
    }

    const MachineSpec& spec = tm_->spec();
    const std::vector<Symbol> symbols(spec.tapeAlphabet.begin(), spec.tapeAlphabet.end());
    const std::vector<StateId> states(spec.states.begin(), spec.states.end());

    // Текущая пара (state, symbol) подсвечивается
    const Symbol underHead = tm_->tape().get(static_cast<long long>(tm_->head()));

    sf::RectangleShape headerBg;
    headerBg.setPosition(layout.table.pos);
    headerBg.setSize({layout.table.size.x, headerH + padding});
    headerBg.setFillColor(sf::Color(70, 65, 85));
    window.draw(headerBg);

    text.setStyle(sf::Text::Bold);
    const float baseY = layout.table.pos.y + padding + (headerH - lineHeight_) * 0.5f;
    text.setString("Read");
    text.setPosition({layout.table.pos.x + padding + 6.f, baseY});
    window.draw(text);
    for (std::size_t col = 0; col < states.size(); col++) {
        text.setString(states[col]);
        text.setPosition({layout.table.pos.x + padding + colW * static_cast<float>(col + 1) * 0.6f + 6.f, baseY});
        window.draw(text);
    }
    text.setStyle(sf::Text::Regular);

    const std::size_t totalRows = symbols.size();
    const float maxVisibleF = (layout.table.size.y - headerH - padding * 2.f) / tableRowHeight_;
    const std::size_t maxVisible = static_cast<std::size_t>(std::max(1.f, std::floor(maxVisibleF)));
    firstVisibleTransitionRow_ = std::min(firstVisibleTransitionRow_, totalRows > maxVisible ? totalRows - maxVisible : 0);
    const std::size_t endRow = std::min(totalRows, firstVisibleTransitionRow_ + maxVisible);

    float rowY = layout.table.pos.y + padding + headerH;
    for (std::size_t r = firstVisibleTransitionRow_; r < endRow; r++) {
        const Symbol sym = symbols[r];

        sf::RectangleShape rowBg;
        rowBg.setPosition({layout.table.pos.x, rowY});
        rowBg.setSize({layout.table.size.x - vScrollbarW - padding, tableRowHeight_});
        rowBg.setFillColor((r % 2) == 0 ? sf::Color(60, 55, 70) : sf::Color(55, 50, 65));
        window.draw(rowBg);

        text.setString(displaySymbol(sym));
        text.setPosition({layout.table.pos.x + padding + 6.f, rowY + (tableRowHeight_ - lineHeight_) * 0.5f});
        window.draw(text);

        for (std::size_t col = 0; col < states.size(); col++) {
            const float x = layout.table.pos.x + padding + colW * static_cast<float>(col + 1) * 0.6f;
            const bool active = !tm_->isHalted() && sym == underHead && states[col] == tm_->state();
            if (active) {
                sf::RectangleShape cellBg;
                cellBg.setPosition({x, rowY});
                cellBg.setSize({colW * 0.6f, tableRowHeight_});
                cellBg.setFillColor(sf::Color(200, 120, 60));
                window.draw(cellBg);
            }

            std::string cell = "-";
            if (spec.acceptStates.count(states[col])) {
                cell = "accept";
            } else if (const Transition* tr = spec.transitions.get(states[col], sym)) {
                cell = formatTransition(*tr);
            }
            text.setString(cell);
            text.setPosition({x + 6.f, rowY + (tableRowHeight_ - lineHeight_) * 0.5f});
            window.draw(text);
        }
        rowY += tableRowHeight_;
    }

    // Вертикальный скроллбар
    const float sbX = layout.table.pos.x + layout.table.size.x - padding - vScrollbarW;
    const float sbY = layout.table.pos.y + padding + headerH;
    const float sbH = layout.table.size.y - padding * 2.f - headerH;

    sf::RectangleShape track;
    track.setPosition({sbX, sbY});
    track.setSize({vScrollbarW, sbH});
    track.setFillColor(sf::Color(60, 60, 70));
    window.draw(track);

    if (totalRows > maxVisible) {
        const float ratio = static_cast<float>(maxVisible) / static_cast<float>(totalRows);
        const float thumbH = std::max(20.f, sbH * ratio);
        const float maxScroll = static_cast<float>(totalRows - maxVisible);
        const float t = static_cast<float>(firstVisibleTransitionRow_) / maxScroll;

        sf::RectangleShape thumb;
        thumb.setPosition({sbX, sbY + t * (sbH - thumbH)});
        thumb.setSize({vScrollbarW, thumbH});
        thumb.setFillColor(sf::Color(180, 180, 200));
        window.draw(thumb);
    }

    window.setView(prevView);
}


void App::requestEncrypt() {
    prepare(CipherOperation::Encrypt);
}

void App::requestDecrypt() {
    prepare(CipherOperation::Decrypt);
}

// prepare - Разбор примера, построение машины, загрузка ленты
void App::prepare(CipherOperation operation) {
    if (mode_ == AppMode::Running) {
        return;
    }

    std::string line;
    CaseSource source = CaseSource::Manual;
    if (inputFocused_ || cases_.empty()) {
        // Ручной ввод переводится в верхний регистр
        line = toUpperCopy(trimCopy(manualInput_));
    } else {
        line = cases_[selectedCase_].text;
        source = cases_[selectedCase_].source;
    }

    std::vector<Diagnostic> diags;
    const auto parsed = parseCase(line, 0, diags);
    if (!parsed) {
        rejectInput(diags);
        return;
    }

    const int shift = normalizeShift(parsed->shift);
    const int machineShift = operation == CipherOperation::Encrypt ? shift : normalizeShift(kCipherAlphabetSize - shift);
    MachineSpec spec = buildCaesarMachine(machineShift);
    if (!checkCipherInput(parsed->message, spec, diags)) {
        rejectInput(diags);
        return;
    }

    tm_.emplace(std::move(spec));
    tm_->loadTape(parsed->message);

    operation_ = operation;
    source_ = source;
    case_ = *parsed;
    inputLine_ = line;
    machineShift_ = machineShift;
    expected_ = operation == CipherOperation::Encrypt ? caesarEncrypt(parsed->message, parsed->shift)
                                                      : caesarDecrypt(parsed->message, parsed->shift);
    result_.clear();
    haltReason_ = HaltReason::Running;
    statusMessage_.clear();
    mode_ = AppMode::Ready;
    tapeOffset_ = -2;
    firstVisibleTransitionRow_ = 0;

    std::cout << "------------------------------------------------------------" << std::endl;
    std::cout << operationName(operation) << std::endl;
    std::cout << "Input:   " << line << std::endl;
    std::cout << "Key:     " << parsed->keyText << " (shift = " << parsed->shift << ")" << std::endl;
    std::cout << "Message: " << parsed->message << std::endl;
}


// rejectInput - Ошибка во входной строке: прежняя машина больше не управляется
void App::rejectInput(const std::vector<Diagnostic>& diags) {
    printDiagnostics(std::cout, "input", diags);
    statusMessage_ = diags.empty() ? "Invalid input" : diags.front().message;
    tm_.reset();
    expected_.clear();
    result_.clear();
    haltReason_ = HaltReason::Running;
    mode_ = AppMode::InputError;
}


void App::requestStep() {
    if (!hasMachine()) {
        return;
    }

    if (mode_ == AppMode::Halted) {
        return;
    }

    // Лимит шагов задаёт приложение, сама машина его не проверяет
    if (tm_->steps() >= settings_.maxSteps) {
        finishRun(tm_->inAcceptState() ? HaltReason::Accepted : HaltReason::MaxSteps);
        return;
    }

    if (tm_->step()) {
        if (mode_ != AppMode::Running && mode_ != AppMode::Paused) {
            mode_ = AppMode::Ready;
        }
        ensureTapeHeadVisible();
    } else {
        finishRun(tm_->haltReason());
    }
}


void App::finishRun(HaltReason reason) {
    haltReason_ = reason;
    mode_ = AppMode::Halted;
    result_ = tm_->getTapeContent();
    ensureTapeHeadVisible();

    std::cout << "Result:  " << result_ << "  (" << tm_->steps() << " steps, "
              << haltReasonName(reason) << ")" << std::endl;

    if (reason != HaltReason::Accepted) {
        statusMessage_ = std::string("Machine stopped without accepting: ") + haltReasonName(reason);
        return;
    }

    if (result_ != expected_) {
        std::cout << "Warning: engine result differs from arithmetic cipher: " << expected_ << std::endl;
    }

    ResultReport report;
    report.operation = operationName(operation_);
    report.input = inputLine_;
    report.shift = case_.shift;
    report.original = case_.message;
    report.result = result_;
    report.steps = tm_->steps();
    report.haltReason = haltReasonName(reason);

    std::string path = settings_.manualResultFile;
    if (source_ != CaseSource::Manual) {
        path = operation_ == CipherOperation::Encrypt ? settings_.encryptResultFile : settings_.decryptResultFile;
    }

    std::vector<Diagnostic> diags;
    if (saveResult(path, formatResultReport(report), diags)) {
        statusMessage_ = "Result saved to: " + path;
        std::cout << statusMessage_ << std::endl;
    } else {
        printDiagnostics(std::cout, path, diags);
        statusMessage_ = diags.empty() ? "Cannot save result" : diags.front().message;
    }
}


void App::requestRun() {
    if (!hasMachine()) {
        return;
    }

    // Остановленную машину запускаем заново с того же входа
    if (mode_ == AppMode::Halted) {
        requestReset();
    }
    mode_ = AppMode::Running;
}


void App::requestPause() {
    if (mode_ == AppMode::Running) {
        mode_ = AppMode::Paused;
    }
}


void App::requestReset() {
    if (!hasMachine() || mode_ == AppMode::Running) {
        return;
    }
    tm_->loadTape(case_.message);
    result_.clear();
    haltReason_ = HaltReason::Running;
    statusMessage_.clear();
    mode_ = AppMode::Ready;
    tapeOffset_ = -2;
}
