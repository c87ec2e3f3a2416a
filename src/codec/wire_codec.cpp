#include <stdexcept>

#include "relaydeck/codec/wire_codec.hpp"

using namespace nlohmann;
using namespace relaydeck::codec;
using namespace relaydeck::data;
using namespace std;

namespace
{
constexpr size_t MAX_SUBSCRIPTION_ID_LENGTH = 64;

json parseFrame(const string& frame)
{
    json jMessage;
    try
    {
        jMessage = json::parse(frame);
    }
    catch (const json::parse_error& pe)
    {
        throw CodecError(string("Frame is not valid JSON: ") + pe.what());
    }

    if (!jMessage.is_array() || jMessage.empty() || !jMessage.at(0).is_string())
    {
        throw CodecError("Frame must be a JSON array beginning with a message type.");
    }

    return jMessage;
};

string requireString(const json& jMessage, size_t index, const string& messageType)
{
    if (jMessage.size() <= index || !jMessage.at(index).is_string())
    {
        throw CodecError(messageType + " frame requires a string at position " + to_string(index) + ".");
    }
    return jMessage.at(index).get<string>();
};

string optionalString(const json& jMessage, size_t index, const string& messageType)
{
    if (jMessage.size() <= index)
    {
        return string();
    }
    return requireString(jMessage, index, messageType);
};

shared_ptr<const Event> requireEvent(const json& jMessage, size_t index, const string& messageType)
{
    if (jMessage.size() <= index || !jMessage.at(index).is_object())
    {
        throw CodecError(messageType + " frame requires an event object at position " + to_string(index) + ".");
    }

    try
    {
        return make_shared<const Event>(Event::fromJson(jMessage.at(index)));
    }
    catch (const invalid_argument& ia)
    {
        throw CodecError(messageType + " frame carries a malformed event: " + ia.what());
    }
    catch (const json::exception& je)
    {
        throw CodecError(messageType + " frame carries a malformed event: " + je.what());
    }
};

void requireSubscriptionId(const string& subscriptionId)
{
    if (subscriptionId.empty() || subscriptionId.length() > MAX_SUBSCRIPTION_ID_LENGTH)
    {
        throw invalid_argument("WireCodec::encode: The subscription ID must be between 1 and 64 characters.");
    }
};
} // namespace

ClientMessage ClientMessage::req(string subscriptionId, vector<Filter> filters)
{
    ClientMessage message;
    message.type = ClientMessageType::Req;
    message.subscriptionId = move(subscriptionId);
    message.filters = move(filters);
    return message;
};

ClientMessage ClientMessage::close(string subscriptionId)
{
    ClientMessage message;
    message.type = ClientMessageType::Close;
    message.subscriptionId = move(subscriptionId);
    return message;
};

ClientMessage ClientMessage::publish(shared_ptr<const Event> event)
{
    ClientMessage message;
    message.type = ClientMessageType::Event;
    message.event = move(event);
    return message;
};

ClientMessage ClientMessage::auth(shared_ptr<const Event> event)
{
    ClientMessage message;
    message.type = ClientMessageType::Auth;
    message.event = move(event);
    return message;
};

bool ClientMessage::operator==(const ClientMessage& other) const
{
    if (this->type != other.type
        || this->subscriptionId != other.subscriptionId
        || this->filters != other.filters)
    {
        return false;
    }

    if (this->event == nullptr || other.event == nullptr)
    {
        return this->event == other.event;
    }

    return this->event->isIdenticalTo(*other.event);
};

string WireCodec::encode(const ClientMessage& message)
{
    json jarr = json::array();

    switch (message.type)
    {
    case ClientMessageType::Req:
        requireSubscriptionId(message.subscriptionId);
        if (message.filters.empty())
        {
            throw invalid_argument("WireCodec::encode: A REQ message requires at least one filter.");
        }
        jarr.push_back("REQ");
        jarr.push_back(message.subscriptionId);
        for (const auto& filter : message.filters)
        {
            jarr.push_back(json(filter));
        }
        break;

    case ClientMessageType::Close:
        requireSubscriptionId(message.subscriptionId);
        jarr.push_back("CLOSE");
        jarr.push_back(message.subscriptionId);
        break;

    case ClientMessageType::Event:
    case ClientMessageType::Auth:
        if (message.event == nullptr)
        {
            throw invalid_argument("WireCodec::encode: EVENT and AUTH messages require an event.");
        }
        jarr.push_back(message.type == ClientMessageType::Event ? "EVENT" : "AUTH");
        jarr.push_back(message.event->toJson());
        break;
    }

    return jarr.dump();
};

RelayMessage WireCodec::decode(const string& frame)
{
    json jMessage = parseFrame(frame);

    RelayMessage message;
    message.label = jMessage.at(0).get<string>();

    if (message.label == "EVENT")
    {
        message.type = RelayMessageType::Event;
        message.subscriptionId = requireString(jMessage, 1, message.label);
        message.event = requireEvent(jMessage, 2, message.label);
    }
    else if (message.label == "EOSE")
    {
        message.type = RelayMessageType::Eose;
        message.subscriptionId = requireString(jMessage, 1, message.label);
    }
    else if (message.label == "OK")
    {
        message.type = RelayMessageType::Ok;
        message.eventId = requireString(jMessage, 1, message.label);
        if (jMessage.size() <= 2 || !jMessage.at(2).is_boolean())
        {
            throw CodecError("OK frame requires a boolean at position 2.");
        }
        message.accepted = jMessage.at(2).get<bool>();
        message.message = optionalString(jMessage, 3, message.label);
    }
    else if (message.label == "NOTICE")
    {
        message.type = RelayMessageType::Notice;
        message.message = requireString(jMessage, 1, message.label);
    }
    else if (message.label == "CLOSED")
    {
        message.type = RelayMessageType::Closed;
        message.subscriptionId = requireString(jMessage, 1, message.label);
        message.message = optionalString(jMessage, 2, message.label);
    }
    else if (message.label == "AUTH")
    {
        message.type = RelayMessageType::Auth;
        message.message = requireString(jMessage, 1, message.label);
    }
    else
    {
        message.type = RelayMessageType::Unknown;
    }

    return message;
};

ClientMessage WireCodec::decodeClientMessage(const string& frame)
{
    json jMessage = parseFrame(frame);
    string messageType = jMessage.at(0).get<string>();

    if (messageType == "REQ")
    {
        string subscriptionId = requireString(jMessage, 1, messageType);
        if (jMessage.size() < 3)
        {
            throw CodecError("REQ frame requires at least one filter.");
        }

        vector<Filter> filters;
        for (size_t i = 2; i < jMessage.size(); i++)
        {
            try
            {
                filters.push_back(Filter::fromJson(jMessage.at(i)));
            }
            catch (const invalid_argument& ia)
            {
                throw CodecError(string("REQ frame carries a malformed filter: ") + ia.what());
            }
            catch (const json::exception& je)
            {
                throw CodecError(string("REQ frame carries a malformed filter: ") + je.what());
            }
        }
        return ClientMessage::req(subscriptionId, filters);
    }
    else if (messageType == "CLOSE")
    {
        return ClientMessage::close(requireString(jMessage, 1, messageType));
    }
    else if (messageType == "EVENT")
    {
        return ClientMessage::publish(requireEvent(jMessage, 1, messageType));
    }
    else if (messageType == "AUTH")
    {
        return ClientMessage::auth(requireEvent(jMessage, 1, messageType));
    }

    throw CodecError("Unrecognized client message type: " + messageType);
};

string WireCodec::typeName(RelayMessageType type)
{
    switch (type)
    {
    case RelayMessageType::Event:
        return "EVENT";
    case RelayMessageType::Eose:
        return "EOSE";
    case RelayMessageType::Ok:
        return "OK";
    case RelayMessageType::Notice:
        return "NOTICE";
    case RelayMessageType::Closed:
        return "CLOSED";
    case RelayMessageType::Auth:
        return "AUTH";
    case RelayMessageType::Unknown:
        break;
    }
    return "UNKNOWN";
};
