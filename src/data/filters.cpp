#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>

#include "relaydeck/data/data.hpp"

using namespace nlohmann;
using namespace relaydeck::data;
using namespace std;

namespace
{
constexpr size_t MAX_SUBSCRIPTION_ID_LENGTH = 64;
constexpr int64_t MAX_FILTER_KIND = 65535;

vector<string> readStringList(const json& value, const string& name)
{
    if (!value.is_array())
    {
        throw invalid_argument("Filter::fromJson: Field '" + name + "' must be an array.");
    }

    vector<string> values;
    for (const auto& item : value)
    {
        if (!item.is_string())
        {
            throw invalid_argument("Filter::fromJson: Field '" + name + "' must contain only strings.");
        }
        values.push_back(item.get<string>());
    }
    return values;
};

time_t readTimestamp(const json& value, const string& name)
{
    if (!value.is_number_integer() || value.get<int64_t>() < 0)
    {
        throw invalid_argument("Filter::fromJson: Field '" + name + "' must be a non-negative integer.");
    }
    return value.get<time_t>();
};

/**
 * @brief Maps tag filters to their bare tag names, merging `e` and `#e` and dropping empty entries.
 */
map<string, vector<string>> normalizeTags(const unordered_map<string, vector<string>>& tags)
{
    map<string, vector<string>> normalized;
    for (const auto& [name, values] : tags)
    {
        string tagName = !name.empty() && name[0] == '#' ? name.substr(1) : name;
        if (tagName.empty() || values.empty())
        {
            continue;
        }

        vector<string>& merged = normalized[tagName];
        merged.insert(merged.end(), values.begin(), values.end());
    }
    return normalized;
};

template <typename T>
bool contains(const vector<T>& values, const T& value)
{
    return find(values.begin(), values.end(), value) != values.end();
};
} // namespace

string Filter::serialize(const string& subscriptionId) const
{
    if (subscriptionId.empty() || subscriptionId.length() > MAX_SUBSCRIPTION_ID_LENGTH)
    {
        throw invalid_argument("Filter::serialize: The subscription ID must be between 1 and 64 characters.");
    }

    json j = *this;
    json jarr = json::array({ "REQ", subscriptionId, j });

    return jarr.dump();
};

Filter Filter::fromJson(const json& j)
{
    return j.get<Filter>();
};

bool Filter::matches(const Event& event) const
{
    if (!this->ids.empty() && !contains(this->ids, event.id))
    {
        return false;
    }

    if (!this->authors.empty() && !contains(this->authors, event.pubkey))
    {
        return false;
    }

    if (!this->kinds.empty() && !contains(this->kinds, event.kind))
    {
        return false;
    }

    if (this->since > 0 && event.createdAt < this->since)
    {
        return false;
    }

    if (this->until > 0 && event.createdAt > this->until)
    {
        return false;
    }

    for (const auto& [name, values] : this->tags)
    {
        if (name.empty() || values.empty())
        {
            continue;
        }

        string tagName = name[0] == '#' ? name.substr(1) : name;
        bool tagMatched = any_of(event.tags.begin(), event.tags.end(), [&tagName, &values](const vector<string>& tag)
        {
            return tag.size() >= 2 && tag[0] == tagName && contains(values, tag[1]);
        });

        if (!tagMatched)
        {
            return false;
        }
    }

    return true;
};

bool Filter::matchesAny(const vector<Filter>& filters, const Event& event)
{
    return any_of(filters.begin(), filters.end(), [&event](const Filter& filter)
    {
        return filter.matches(event);
    });
};

bool Filter::operator==(const Filter& other) const
{
    return this->ids == other.ids
        && this->authors == other.authors
        && this->kinds == other.kinds
        && normalizeTags(this->tags) == normalizeTags(other.tags)
        && this->since == other.since
        && this->until == other.until
        && this->limit == other.limit;
};

void nlohmann::adl_serializer<Filter>::to_json(json& j, const Filter& filter)
{
    j = json::object();

    if (!filter.ids.empty())
    {
        j["ids"] = filter.ids;
    }
    if (!filter.authors.empty())
    {
        j["authors"] = filter.authors;
    }
    if (!filter.kinds.empty())
    {
        j["kinds"] = filter.kinds;
    }
    if (filter.since > 0)
    {
        j["since"] = filter.since;
    }
    if (filter.until > 0)
    {
        j["until"] = filter.until;
    }
    if (filter.limit > 0)
    {
        j["limit"] = filter.limit;
    }

    for (auto& [name, values] : normalizeTags(filter.tags))
    {
        j['#' + name] = values;
    }
}

void nlohmann::adl_serializer<Filter>::from_json(const json& j, Filter& filter)
{
    if (!j.is_object())
    {
        throw invalid_argument("Filter::fromJson: A filter must be a JSON object.");
    }

    filter = Filter();
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const string& key = it.key();
        const json& value = it.value();

        if (key == "ids")
        {
            filter.ids = readStringList(value, key);
        }
        else if (key == "authors")
        {
            filter.authors = readStringList(value, key);
        }
        else if (key == "kinds")
        {
            if (!value.is_array())
            {
                throw invalid_argument("Filter::fromJson: Field 'kinds' must be an array.");
            }
            for (const auto& kind : value)
            {
                if (!kind.is_number_integer() || kind.get<int64_t>() < 0 || kind.get<int64_t>() > MAX_FILTER_KIND)
                {
                    throw invalid_argument("Filter::fromJson: Field 'kinds' must contain only integers between 0 and 65535.");
                }
                filter.kinds.push_back(kind.get<int>());
            }
        }
        else if (key == "since")
        {
            filter.since = readTimestamp(value, key);
        }
        else if (key == "until")
        {
            filter.until = readTimestamp(value, key);
        }
        else if (key == "limit")
        {
            if (!value.is_number_integer()
                || value.get<int64_t>() < 0
                || value.get<int64_t>() > numeric_limits<int>::max())
            {
                throw invalid_argument("Filter::fromJson: Field 'limit' must be a non-negative 32-bit integer.");
            }
            filter.limit = value.get<int>();
        }
        else if (key.length() > 1 && key[0] == '#')
        {
            filter.tags[key.substr(1)] = readStringList(value, key);
        }
        // Other keys, such as NIP-50 `search`, are not interpreted by the client.
    }
}
