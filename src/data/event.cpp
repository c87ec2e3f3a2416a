#include <ctime>
#include <stdexcept>

#include "relaydeck/data/data.hpp"
#include "../internal/hex.hpp"

using namespace nlohmann;
using namespace relaydeck::data;
using namespace std;

namespace
{
constexpr int MAX_EVENT_KIND = 65535;
constexpr size_t ID_HEX_LENGTH = 64;
constexpr size_t PUBKEY_HEX_LENGTH = 64;
constexpr size_t SIG_HEX_LENGTH = 128;

const json& requireField(const json& j, const char* name)
{
    auto it = j.find(name);
    if (it == j.end())
    {
        throw invalid_argument(string("Event::fromJson: Missing required field '") + name + "'.");
    }
    return *it;
};

string requireHex(const json& j, const char* name, size_t length)
{
    const json& value = requireField(j, name);
    if (!value.is_string())
    {
        throw invalid_argument(string("Event::fromJson: Field '") + name + "' must be a string.");
    }

    string hex = value.get<string>();
    if (!relaydeck::internal::isLowerHex(hex, length))
    {
        throw invalid_argument(string("Event::fromJson: Field '") + name + "' must be lowercase hex of length " + to_string(length) + ".");
    }
    return hex;
};
} // namespace

string Event::serialize()
{
    this->validate();

    // Generate the event ID from the serialized data.
    this->id = this->computeId();

    json j = *this;
    return j.dump();
};

json Event::toJson() const
{
    return json(*this);
};

Event Event::fromString(string jstr)
{
    json j = json::parse(jstr);
    return Event::fromJson(j);
};

Event Event::fromJson(const json& j)
{
    Event event = j.get<Event>();
    return event;
};

string Event::computeId() const
{
    // Create a JSON array of values used to generate the event ID.
    json arr = json::array({ 0, this->pubkey, this->createdAt, this->kind, this->tags, this->content });
    string serializedData = arr.dump();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    EVP_Digest(serializedData.c_str(), serializedData.length(), hash, NULL, EVP_sha256(), NULL);

    return relaydeck::internal::toHex(hash, SHA256_DIGEST_LENGTH);
};

string Event::firstTagValue(const string& name) const
{
    for (const auto& tag : this->tags)
    {
        if (tag.size() >= 2 && tag[0] == name)
        {
            return tag[1];
        }
    }
    return string();
};

void Event::validate()
{
    bool hasPubkey = this->pubkey.length() > 0;
    if (!hasPubkey)
    {
        throw invalid_argument("Event::validate: The pubkey of the event author is required.");
    }

    bool hasCreatedAt = this->createdAt > 0;
    if (!hasCreatedAt)
    {
        this->createdAt = time(nullptr);
    }

    bool hasKind = this->kind >= 0 && this->kind <= MAX_EVENT_KIND;
    if (!hasKind)
    {
        throw invalid_argument("Event::validate: A valid event kind is required.");
    }
};

bool Event::operator==(const Event& other) const
{
    if (this->id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the left-side argument is undefined.");
    }
    if (other.id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the right-side argument is undefined.");
    }

    return this->id == other.id;
};

bool Event::isIdenticalTo(const Event& other) const
{
    return this->id == other.id
        && this->pubkey == other.pubkey
        && this->createdAt == other.createdAt
        && this->kind == other.kind
        && this->tags == other.tags
        && this->content == other.content
        && this->sig == other.sig;
};

void nlohmann::adl_serializer<Event>::to_json(json& j, const Event& event)
{
    j = {
        { "id", event.id },
        { "pubkey", event.pubkey },
        { "created_at", event.createdAt },
        { "kind", event.kind },
        { "tags", event.tags },
        { "content", event.content },
        { "sig", event.sig },
    };
}

void nlohmann::adl_serializer<Event>::from_json(const json& j, Event& event)
{
    if (!j.is_object())
    {
        throw invalid_argument("Event::fromJson: An event must be a JSON object.");
    }

    event.id = requireHex(j, "id", ID_HEX_LENGTH);
    event.pubkey = requireHex(j, "pubkey", PUBKEY_HEX_LENGTH);
    event.sig = requireHex(j, "sig", SIG_HEX_LENGTH);

    const json& createdAt = requireField(j, "created_at");
    if (!createdAt.is_number_integer() || createdAt.get<int64_t>() < 0)
    {
        throw invalid_argument("Event::fromJson: Field 'created_at' must be a non-negative integer.");
    }
    event.createdAt = createdAt.get<time_t>();

    const json& kind = requireField(j, "kind");
    if (!kind.is_number_integer() || kind.get<int64_t>() < 0 || kind.get<int64_t>() > MAX_EVENT_KIND)
    {
        throw invalid_argument("Event::fromJson: Field 'kind' must be an integer between 0 and 65535.");
    }
    event.kind = kind.get<int>();

    const json& tags = requireField(j, "tags");
    if (!tags.is_array())
    {
        throw invalid_argument("Event::fromJson: Field 'tags' must be an array.");
    }
    event.tags.clear();
    for (const auto& tag : tags)
    {
        if (!tag.is_array())
        {
            throw invalid_argument("Event::fromJson: Each tag must be an array.");
        }

        vector<string> values;
        for (const auto& value : tag)
        {
            if (!value.is_string())
            {
                throw invalid_argument("Event::fromJson: Tag values must be strings.");
            }
            values.push_back(value.get<string>());
        }
        event.tags.push_back(move(values));
    }

    const json& content = requireField(j, "content");
    if (!content.is_string())
    {
        throw invalid_argument("Event::fromJson: Field 'content' must be a string.");
    }
    event.content = content.get<string>();
}
