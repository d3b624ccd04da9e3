#pragma once
#include "channel/MethodChannel.hpp"
#include "plugins/Plugin.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace PB {

// Number of UTF-16 code units in UTF-8 text. Invalid bytes count as one unit.
[[nodiscard]] auto utf16Length(std::string_view text) -> std::int64_t;
// Byte offset of a UTF-16 offset, clamped to the text. An offset inside a
// surrogate pair rounds up to the end of the code point.
[[nodiscard]] auto utf8OffsetOfUtf16(std::string_view text, std::int64_t units) -> size_t;

/*
 * Editing value exchanged with the framework. Offsets count UTF-16 code
 * units, and -1 marks an empty selection or composing range.
 */
struct TextEditingState {
    std::string  text;
    std::int64_t selectionBase          = -1;
    std::int64_t selectionExtent        = -1;
    std::string  selectionAffinity      = "TextAffinity.downstream";
    bool         selectionIsDirectional = false;
    std::int64_t composingBase          = -1;
    std::int64_t composingExtent        = -1;

    [[nodiscard]] static auto fromValue(Value const& value) -> Expected<TextEditingState>;
    [[nodiscard]] auto        toValue() const -> Value;

    // Replaces the selection with characters and puts the caret after them.
    // Without a valid selection the characters are appended.
    auto addCharacters(std::string_view characters) -> void;

    bool operator==(TextEditingState const&) const = default;
};

// Second argument of TextInput.setClient.
struct TextInputClientConfig {
    bool                       autocorrect = true;
    std::string                inputAction;
    bool                       obscureText = false;
    std::string                keyboardAppearance;
    std::optional<std::string> actionLabel;
    std::string                textCapitalization;
    std::string                inputTypeName;
    std::optional<bool>        inputTypeSigned;
    std::optional<bool>        inputTypeDecimal;

    [[nodiscard]] static auto fromValue(Value const& value) -> Expected<TextInputClientConfig>;

    // Enter inserts a line break before the action is performed.
    [[nodiscard]] auto isMultilineNewline() const -> bool;
};

class TextInputHandler {
public:
    virtual ~TextInputHandler() = default;

    virtual auto show() -> void = 0;
    virtual auto hide() -> void = 0;
};

// flutter/textinput (JSON method codec): tracks the active client and its
// editing state, shows and hides the host keyboard, and reports edits and
// actions back to the framework.
class TextInputPlugin final : public Plugin {
public:
    static constexpr std::string_view kChannelName = "flutter/textinput";

    explicit TextInputPlugin(std::shared_ptr<TextInputHandler> handler);

    [[nodiscard]] auto pluginName() const -> std::string_view override { return "textinput"; }
    auto attach(BinaryMessenger& messenger) -> Expected<void> override;
    auto detach() -> void override;

    [[nodiscard]] auto clientId() const -> std::optional<std::int64_t>;
    [[nodiscard]] auto editingState() const -> std::optional<TextEditingState>;

    // Runs edit on the current editing state. False when there is none.
    auto withState(std::function<void(TextEditingState&)> const& edit) -> bool;

    // TextInputClient.performAction with "TextInputAction.<action>".
    auto performAction(std::string_view action) -> Expected<void>;
    // TextInputClient.updateEditingState with the current state, if any.
    auto notifyChanges() -> Expected<void>;
    auto enterPressed() -> Expected<void>;

private:
    struct Client {
        std::mutex                           mutex;
        std::optional<std::int64_t>          id;
        std::optional<TextInputClientConfig> config;
        std::optional<TextEditingState>      state;
    };

    auto invoke(std::string const& method, Value arguments) -> Expected<void>;

    std::shared_ptr<TextInputHandler> handler;
    std::shared_ptr<std::mutex>       handlerMutex;
    std::shared_ptr<Client>           client;
    std::optional<MethodChannel>      channel;
};

} // namespace PB
