#include "plugins/TextInputPlugin.hpp"
#include "codec/JsonCodec.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace PB {
namespace {

constexpr std::string_view kMultilineInputType = "TextInputType.multiline";
constexpr std::string_view kNewlineAction      = "TextInputAction.newline";
constexpr char const*      kBadArguments       = "Bad Arguments";

// Bytes and UTF-16 units of the code point starting at text[index].
auto code_point_at(std::string_view text, size_t index) -> std::pair<size_t, std::int64_t> {
    auto const   lead  = static_cast<unsigned char>(text[index]);
    size_t       bytes = 1;
    std::int64_t units = 1;
    if (lead >= 0xC0 && lead < 0xE0) {
        bytes = 2;
    } else if (lead >= 0xE0 && lead < 0xF0) {
        bytes = 3;
    } else if (lead >= 0xF0 && lead < 0xF8) {
        bytes = 4;
        units = 2;
    }
    if (index + bytes > text.size()) {
        return {1, 1};
    }
    return {bytes, units};
}

template <typename T>
auto optional_field(Value const& map, std::string_view key, std::string_view owner) -> Expected<std::optional<T>> {
    auto const* field = map.lookup(key);
    if (field == nullptr || field->isNull()) {
        return std::optional<T>{};
    }
    if constexpr (std::is_same_v<T, std::int64_t>) {
        std::int64_t out = 0;
        if (field->asInt64(out)) {
            return std::optional<T>{out};
        }
    } else if (auto const* typed = field->get_if<T>()) {
        return std::optional<T>{*typed};
    }
    return std::unexpected(Error{Error::Code::InvalidArgument,
                                 std::string(owner) + "." + std::string(key) + " has type "
                                         + std::string(valueTypeToString(field->type()))});
}

template <typename T>
auto required_field(Value const& map, std::string_view key, std::string_view owner) -> Expected<T> {
    auto field = optional_field<T>(map, key, owner);
    if (!field) {
        return std::unexpected(field.error());
    }
    if (!*field) {
        return std::unexpected(Error{Error::Code::InvalidArgument, std::string(owner) + " is missing " + std::string(key)});
    }
    return std::move(**field);
}

auto parse_set_client(Value const& arguments) -> Expected<std::pair<std::int64_t, TextInputClientConfig>> {
    auto const* list = arguments.get_if<ValueList>();
    if (list == nullptr || list->size() < 2) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "setClient expects [id, configuration]"});
    }
    std::int64_t id = 0;
    if (!(*list)[0].asInt64(id)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "setClient id must be an integer"});
    }
    auto config = TextInputClientConfig::fromValue((*list)[1]);
    if (!config) {
        return std::unexpected(config.error());
    }
    return std::make_pair(id, std::move(*config));
}

} // namespace

auto utf16Length(std::string_view text) -> std::int64_t {
    std::int64_t units = 0;
    for (size_t index = 0; index < text.size();) {
        auto const [bytes, width] = code_point_at(text, index);
        index += bytes;
        units += width;
    }
    return units;
}

auto utf8OffsetOfUtf16(std::string_view text, std::int64_t units) -> size_t {
    size_t       index = 0;
    std::int64_t seen  = 0;
    while (index < text.size() && seen < units) {
        auto const [bytes, width] = code_point_at(text, index);
        index += bytes;
        seen += width;
    }
    return index;
}

auto TextEditingState::fromValue(Value const& value) -> Expected<TextEditingState> {
    constexpr std::string_view owner = "TextEditingState";
    if (!value.holds<ValueMap>()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "TextEditingState must be a map"});
    }
    TextEditingState state;
    auto             text = required_field<std::string>(value, "text", owner);
    if (!text) {
        return std::unexpected(text.error());
    }
    state.text = std::move(*text);

    for (auto [key, target] : {std::pair{"selectionBase", &state.selectionBase},
                               std::pair{"selectionExtent", &state.selectionExtent},
                               std::pair{"composingBase", &state.composingBase},
                               std::pair{"composingExtent", &state.composingExtent}}) {
        auto offset = optional_field<std::int64_t>(value, key, owner);
        if (!offset) {
            return std::unexpected(offset.error());
        }
        if (*offset) {
            *target = **offset;
        }
    }
    auto affinity = optional_field<std::string>(value, "selectionAffinity", owner);
    if (!affinity) {
        return std::unexpected(affinity.error());
    }
    if (*affinity) {
        state.selectionAffinity = std::move(**affinity);
    }
    auto directional = optional_field<bool>(value, "selectionIsDirectional", owner);
    if (!directional) {
        return std::unexpected(directional.error());
    }
    state.selectionIsDirectional = directional->value_or(false);
    return state;
}

auto TextEditingState::toValue() const -> Value {
    return Value{ValueMap{
            {Value{"text"}, Value{this->text}},
            {Value{"selectionBase"}, Value{this->selectionBase}},
            {Value{"selectionExtent"}, Value{this->selectionExtent}},
            {Value{"selectionAffinity"}, Value{this->selectionAffinity}},
            {Value{"selectionIsDirectional"}, Value{this->selectionIsDirectional}},
            {Value{"composingBase"}, Value{this->composingBase}},
            {Value{"composingExtent"}, Value{this->composingExtent}},
    }};
}

auto TextEditingState::addCharacters(std::string_view characters) -> void {
    auto const   length = utf16Length(this->text);
    std::int64_t start  = std::min(this->selectionBase, this->selectionExtent);
    std::int64_t end    = std::max(this->selectionBase, this->selectionExtent);
    if (start < 0 || end > length) {
        start = end = length;
    }
    auto const from = utf8OffsetOfUtf16(this->text, start);
    auto const to   = utf8OffsetOfUtf16(this->text, end);
    this->text.replace(from, to - from, characters);

    auto const caret             = start + utf16Length(characters);
    this->selectionBase          = caret;
    this->selectionExtent        = caret;
    this->selectionIsDirectional = false;
    this->composingBase          = -1;
    this->composingExtent        = -1;
}

auto TextInputClientConfig::fromValue(Value const& value) -> Expected<TextInputClientConfig> {
    constexpr std::string_view owner = "TextInputClient";
    if (!value.holds<ValueMap>()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "TextInputClient configuration must be a map"});
    }
    TextInputClientConfig config;
    auto                  action = required_field<std::string>(value, "inputAction", owner);
    if (!action) {
        return std::unexpected(action.error());
    }
    config.inputAction = std::move(*action);

    auto const* inputType = value.lookup("inputType");
    if (inputType == nullptr || !inputType->holds<ValueMap>()) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "TextInputClient is missing inputType"});
    }
    auto name = required_field<std::string>(*inputType, "name", "inputType");
    if (!name) {
        return std::unexpected(name.error());
    }
    config.inputTypeName = std::move(*name);
    auto isSigned        = optional_field<bool>(*inputType, "signed", "inputType");
    auto isDecimal       = optional_field<bool>(*inputType, "decimal", "inputType");
    if (!isSigned || !isDecimal) {
        return std::unexpected(!isSigned ? isSigned.error() : isDecimal.error());
    }
    config.inputTypeSigned  = *isSigned;
    config.inputTypeDecimal = *isDecimal;

    auto autocorrect = optional_field<bool>(value, "autocorrect", owner);
    auto obscureText = optional_field<bool>(value, "obscureText", owner);
    if (!autocorrect || !obscureText) {
        return std::unexpected(!autocorrect ? autocorrect.error() : obscureText.error());
    }
    config.autocorrect = autocorrect->value_or(true);
    config.obscureText = obscureText->value_or(false);

    for (auto [key, target] : {std::pair{"keyboardAppearance", &config.keyboardAppearance},
                               std::pair{"textCapitalization", &config.textCapitalization}}) {
        auto text = optional_field<std::string>(value, key, owner);
        if (!text) {
            return std::unexpected(text.error());
        }
        *target = text->value_or(std::string{});
    }
    auto label = optional_field<std::string>(value, "actionLabel", owner);
    if (!label) {
        return std::unexpected(label.error());
    }
    config.actionLabel = std::move(*label);
    return config;
}

auto TextInputClientConfig::isMultilineNewline() const -> bool {
    return this->inputTypeName == kMultilineInputType && this->inputAction == kNewlineAction;
}

TextInputPlugin::TextInputPlugin(std::shared_ptr<TextInputHandler> handler)
    : handler(std::move(handler)), handlerMutex(std::make_shared<std::mutex>()), client(std::make_shared<Client>()) {}

auto TextInputPlugin::attach(BinaryMessenger& messenger) -> Expected<void> {
    if (!this->handler) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "Text input plugin needs a handler"});
    }
    this->channel.emplace(messenger, std::string(kChannelName), JsonMethodCodec::instance());
    auto handler = this->handler;
    auto mutex   = this->handlerMutex;
    auto client  = this->client;
    return this->channel->setMethodCallHandler([handler, mutex, client](MethodCall const& call, MethodResponder responder) {
        pb_log("textinput method call " + call.method, "textinput");
        Expected<void> sent{};
        if (call.method == "TextInput.setClient") {
            auto parsed = parse_set_client(call.arguments);
            if (!parsed) {
                sent = responder.error(kBadArguments, describeError(parsed.error()));
            } else {
                {
                    std::lock_guard<std::mutex> lock(client->mutex);
                    client->id     = parsed->first;
                    client->config = std::move(parsed->second);
                }
                sent = responder.success();
            }
        } else if (call.method == "TextInput.clearClient") {
            {
                std::lock_guard<std::mutex> lock(client->mutex);
                client->id.reset();
                client->state.reset();
            }
            sent = responder.success();
        } else if (call.method == "TextInput.setEditingState") {
            auto state = TextEditingState::fromValue(call.arguments);
            if (!state) {
                sent = responder.error(kBadArguments, describeError(state.error()));
            } else {
                {
                    std::lock_guard<std::mutex> lock(client->mutex);
                    client->state = std::move(*state);
                }
                sent = responder.success();
            }
        } else if (call.method == "TextInput.show" || call.method == "TextInput.hide") {
            {
                std::lock_guard<std::mutex> lock(*mutex);
                if (call.method == "TextInput.show") {
                    handler->show();
                } else {
                    handler->hide();
                }
            }
            sent = responder.success();
        } else {
            sent = responder.notImplemented();
        }
        if (!sent) {
            pb_log("textinput reply failed: " + describeError(sent.error()), "textinput", "ERROR");
        }
    });
}

auto TextInputPlugin::detach() -> void {
    if (!this->channel) {
        return;
    }
    if (auto removed = this->channel->setMethodCallHandler(nullptr); !removed) {
        pb_log("textinput detach failed: " + describeError(removed.error()), "textinput", "ERROR");
    }
    this->channel.reset();
    std::lock_guard<std::mutex> lock(this->client->mutex);
    this->client->id.reset();
    this->client->config.reset();
    this->client->state.reset();
}

auto TextInputPlugin::clientId() const -> std::optional<std::int64_t> {
    std::lock_guard<std::mutex> lock(this->client->mutex);
    return this->client->id;
}

auto TextInputPlugin::editingState() const -> std::optional<TextEditingState> {
    std::lock_guard<std::mutex> lock(this->client->mutex);
    return this->client->state;
}

auto TextInputPlugin::withState(std::function<void(TextEditingState&)> const& edit) -> bool {
    std::lock_guard<std::mutex> lock(this->client->mutex);
    if (!this->client->state) {
        return false;
    }
    edit(*this->client->state);
    return true;
}

auto TextInputPlugin::performAction(std::string_view action) -> Expected<void> {
    if (!this->channel) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Text input plugin is not attached"});
    }
    std::optional<std::int64_t> id = this->clientId();
    if (!id) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "No text input client"});
    }
    return this->invoke("TextInputClient.performAction",
                        Value{ValueList{Value{*id}, Value{"TextInputAction." + std::string(action)}}});
}

auto TextInputPlugin::notifyChanges() -> Expected<void> {
    if (!this->channel) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Text input plugin is not attached"});
    }
    Value arguments;
    {
        std::lock_guard<std::mutex> lock(this->client->mutex);
        if (!this->client->state) {
            return {};
        }
        if (!this->client->id) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "No text input client"});
        }
        arguments = Value{ValueList{Value{*this->client->id}, this->client->state->toValue()}};
    }
    return this->invoke("TextInputClient.updateEditingState", std::move(arguments));
}

auto TextInputPlugin::enterPressed() -> Expected<void> {
    if (!this->channel) {
        return std::unexpected(Error{Error::Code::ChannelClosed, "Text input plugin is not attached"});
    }
    std::optional<Value> update;
    std::optional<Value> action;
    {
        std::lock_guard<std::mutex> lock(this->client->mutex);
        if (!this->client->id) {
            return std::unexpected(Error{Error::Code::InvalidArgument, "No text input client"});
        }
        auto const id = *this->client->id;
        if (this->client->config && this->client->config->isMultilineNewline() && this->client->state) {
            this->client->state->addCharacters("\n");
            update = Value{ValueList{Value{id}, this->client->state->toValue()}};
        }
        if (this->client->config) {
            action = Value{ValueList{Value{id}, Value{this->client->config->inputAction}}};
        }
    }
    if (update) {
        if (auto sent = this->invoke("TextInputClient.updateEditingState", std::move(*update)); !sent) {
            return sent;
        }
    }
    if (action) {
        return this->invoke("TextInputClient.performAction", std::move(*action));
    }
    return {};
}

auto TextInputPlugin::invoke(std::string const& method, Value arguments) -> Expected<void> {
    pb_log("textinput sending " + method, "textinput");
    return this->channel->invokeMethod(method, arguments);
}

} // namespace PB
