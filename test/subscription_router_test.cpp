#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "relaydeck/codec/wire_codec.hpp"
#include "relaydeck/pool/subscription_router.hpp"
#include "test_support.hpp"

using namespace relaydeck::codec;
using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace relaydeck_test;
using namespace std;
using namespace ::testing;

/**
 * @brief Serves only relays whose URL contains a marker.
 */
class MarkedRelaysPolicy : public IRelaySelectionPolicy
{
public:
    vector<string> select(const vector<string>& candidates, const vector<Filter>& filters) const override
    {
        vector<string> selected;
        copy_if(candidates.begin(), candidates.end(), back_inserter(selected), [](const string& relay)
        {
            return relay.find("marked") != string::npos;
        });
        return selected;
    };
};

class SubscriptionRouterTest : public testing::Test
{
public:
    inline static const string relayOne = "wss://relay.one";
    inline static const string relayTwo = "wss://relay.two";

    static vector<Filter> kindOneFilters()
    {
        Filter filter;
        filter.kinds = { 1 };
        return { filter };
    };

    static RelayMessage eose(const string& subscriptionId)
    {
        return WireCodec::decode("[\"EOSE\",\"" + subscriptionId + "\"]");
    };

    static RelayMessage closed(const string& subscriptionId, const string& reason)
    {
        return WireCodec::decode("[\"CLOSED\",\"" + subscriptionId + "\",\"" + reason + "\"]");
    };

    static RelayMessage event(const string& subscriptionId, const Event& event)
    {
        return WireCodec::decode(eventFrame(subscriptionId, event));
    };

    static vector<StreamItemType> drainTypes(EventStream& stream)
    {
        vector<StreamItemType> types;
        StreamItem item;
        while (stream.tryNext(item))
        {
            types.push_back(item.type);
        }
        return types;
    };

protected:
    shared_ptr<NiceMock<MockRelayDirectory>> mockDirectory;
    shared_ptr<SubscriptionRouter> router;

    void SetUp() override
    {
        mockDirectory = make_shared<NiceMock<MockRelayDirectory>>();
        ON_CALL(*mockDirectory, connectedRelays()).WillByDefault(Return(vector<string>({ relayOne, relayTwo })));
        router = make_shared<SubscriptionRouter>(mockDirectory);
    };
};

TEST_F(SubscriptionRouterTest, Subscribe_SendsReq_ToEveryConnectedRelay)
{
    EXPECT_CALL(*mockDirectory, openSubscription(relayOne, _, _)).Times(1);
    EXPECT_CALL(*mockDirectory, openSubscription(relayTwo, _, _)).Times(1);

    string subscriptionId = router->subscribe(kindOneFilters());

    ASSERT_TRUE(router->hasSubscription(subscriptionId));
    ASSERT_NE(router->stream(subscriptionId), nullptr);
    ASSERT_EQ(router->subscriptionRelays(subscriptionId).size(), 2);
}

TEST_F(SubscriptionRouterTest, Subscribe_GeneratesUniqueIds)
{
    string first = router->subscribe(kindOneFilters());
    string second = router->subscribe(kindOneFilters());

    ASSERT_NE(first, second);
    ASSERT_LE(first.size(), 64);
    ASSERT_EQ(router->subscriptionCount(), 2);
}

TEST_F(SubscriptionRouterTest, Subscribe_Throws_ForInvalidArguments)
{
    auto stream = make_shared<EventStream>();

    ASSERT_THROW(router->subscribe(vector<Filter>()), invalid_argument);
    ASSERT_THROW(router->subscribe("", kindOneFilters(), stream), invalid_argument);
    ASSERT_THROW(router->subscribe(string(65, 's'), kindOneFilters(), stream), invalid_argument);
    ASSERT_THROW(router->subscribe("sub-1", kindOneFilters(), nullptr), invalid_argument);

    router->subscribe("sub-1", kindOneFilters(), stream);
    ASSERT_THROW(router->subscribe("sub-1", kindOneFilters(), make_shared<EventStream>()), invalid_argument);
}

TEST_F(SubscriptionRouterTest, Subscribe_WithoutConnectedRelays_IsNeverCaughtUp)
{
    ON_CALL(*mockDirectory, connectedRelays()).WillByDefault(Return(vector<string>()));
    EXPECT_CALL(*mockDirectory, openSubscription(_, _, _)).Times(0);

    string subscriptionId = router->subscribe(kindOneFilters());

    ASSERT_TRUE(router->subscriptionRelays(subscriptionId).empty());
    ASSERT_FALSE(router->isCaughtUp(subscriptionId));
}

TEST_F(SubscriptionRouterTest, RouteIncoming_AdmitsEvents_OnlyFromServingRelays)
{
    router->subscribe("sub-1", kindOneFilters(), make_shared<EventStream>());
    Event note = makeEvent("routed");

    ASSERT_TRUE(router->routeIncoming(relayOne, event("sub-1", note)));
    ASSERT_FALSE(router->routeIncoming("wss://stranger.relay", event("sub-1", note)));
    ASSERT_FALSE(router->routeIncoming(relayOne, event("sub-unknown", note)));
}

TEST_F(SubscriptionRouterTest, Eose_FromEveryRelay_SignalsCaughtUpOnce)
{
    auto stream = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), stream);

    router->routeIncoming(relayOne, eose("sub-1"));
    ASSERT_FALSE(router->isCaughtUp("sub-1"));
    ASSERT_TRUE(drainTypes(*stream).empty());

    router->routeIncoming(relayTwo, eose("sub-1"));
    router->routeIncoming(relayTwo, eose("sub-1"));

    ASSERT_TRUE(router->isCaughtUp("sub-1"));
    ASSERT_EQ(drainTypes(*stream), vector<StreamItemType>({ StreamItemType::CaughtUp }));
}

TEST_F(SubscriptionRouterTest, Closed_DetachesRelay_AndNotifiesConsumer)
{
    auto stream = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), stream);

    EXPECT_CALL(*mockDirectory, closeSubscription(relayOne, "sub-1", false)).Times(1);
    router->routeIncoming(relayOne, closed("sub-1", "auth-required: sign in"));

    StreamItem item;
    ASSERT_TRUE(stream->tryNext(item));
    ASSERT_EQ(item.type, StreamItemType::RelayClosed);
    ASSERT_EQ(item.relay, relayOne);
    ASSERT_EQ(item.message, "auth-required: sign in");
    ASSERT_EQ(router->subscriptionRelays("sub-1"), vector<string>({ relayTwo }));

    ASSERT_FALSE(router->routeIncoming(relayOne, event("sub-1", makeEvent("late"))));
}

TEST_F(SubscriptionRouterTest, Closed_ByLastPendingRelay_CompletesCatchUp)
{
    auto stream = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), stream);

    router->routeIncoming(relayOne, eose("sub-1"));
    router->routeIncoming(relayTwo, closed("sub-1", "error: overloaded"));

    ASSERT_TRUE(router->isCaughtUp("sub-1"));
    ASSERT_EQ(drainTypes(*stream), vector<StreamItemType>({ StreamItemType::RelayClosed, StreamItemType::CaughtUp }));
}

TEST_F(SubscriptionRouterTest, RelayThatClosed_IsNotDispatchedAgain)
{
    router->subscribe("sub-1", kindOneFilters(), make_shared<EventStream>());
    router->routeIncoming(relayOne, closed("sub-1", "blocked: no"));

    EXPECT_CALL(*mockDirectory, openSubscription(relayOne, "sub-1", _)).Times(0);
    router->onRelayConnected(relayOne);
}

TEST_F(SubscriptionRouterTest, Unsubscribe_SendsClose_AndEndsStream)
{
    auto stream = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), stream);

    EXPECT_CALL(*mockDirectory, closeSubscription(relayOne, "sub-1", true)).Times(1);
    EXPECT_CALL(*mockDirectory, closeSubscription(relayTwo, "sub-1", true)).Times(1);

    ASSERT_TRUE(router->unsubscribe("sub-1"));
    ASSERT_FALSE(router->hasSubscription("sub-1"));
    ASSERT_EQ(drainTypes(*stream), vector<StreamItemType>({ StreamItemType::Closed }));
    ASSERT_FALSE(router->routeIncoming(relayOne, event("sub-1", makeEvent("after"))));
}

TEST_F(SubscriptionRouterTest, Unsubscribe_ReturnsFalse_ForUnknownSubscription)
{
    EXPECT_CALL(*mockDirectory, closeSubscription(_, _, _)).Times(0);

    ASSERT_FALSE(router->unsubscribe("sub-unknown"));
}

TEST_F(SubscriptionRouterTest, OnRelayConnected_DispatchesExistingSubscriptions)
{
    ON_CALL(*mockDirectory, connectedRelays()).WillByDefault(Return(vector<string>({ relayOne })));
    router->subscribe("sub-1", kindOneFilters(), make_shared<EventStream>());

    EXPECT_CALL(*mockDirectory, openSubscription(relayTwo, "sub-1", kindOneFilters())).Times(1);
    router->onRelayConnected(relayTwo);
    router->onRelayConnected(relayTwo);

    ASSERT_EQ(router->subscriptionRelays("sub-1").size(), 2);
}

TEST_F(SubscriptionRouterTest, OnRelayConnected_DelaysCatchUp_UntilNewRelaySendsEose)
{
    ON_CALL(*mockDirectory, connectedRelays()).WillByDefault(Return(vector<string>({ relayOne })));
    router->subscribe("sub-1", kindOneFilters(), make_shared<EventStream>());

    router->onRelayConnected(relayTwo);
    router->routeIncoming(relayOne, eose("sub-1"));
    ASSERT_FALSE(router->isCaughtUp("sub-1"));

    router->routeIncoming(relayTwo, eose("sub-1"));
    ASSERT_TRUE(router->isCaughtUp("sub-1"));
}

TEST_F(SubscriptionRouterTest, OnRelayLost_RemovesRelay_AndAllowsLaterDispatch)
{
    auto stream = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), stream);

    EXPECT_CALL(*mockDirectory, closeSubscription(relayTwo, "sub-1", false)).Times(1);
    router->onRelayLost(relayTwo, "relay removed");

    StreamItem item;
    ASSERT_TRUE(stream->tryNext(item));
    ASSERT_EQ(item.type, StreamItemType::RelayClosed);
    ASSERT_EQ(item.message, "relay removed");
    ASSERT_EQ(router->subscriptionRelays("sub-1"), vector<string>({ relayOne }));

    EXPECT_CALL(*mockDirectory, openSubscription(relayTwo, "sub-1", _)).Times(1);
    router->onRelayConnected(relayTwo);
}

TEST_F(SubscriptionRouterTest, OnRelayLost_IgnoresUnknownRelays)
{
    router->subscribe("sub-1", kindOneFilters(), make_shared<EventStream>());

    EXPECT_CALL(*mockDirectory, closeSubscription(_, _, _)).Times(0);
    router->onRelayLost("wss://stranger.relay", "gone");

    ASSERT_EQ(router->subscriptionRelays("sub-1").size(), 2);
}

TEST_F(SubscriptionRouterTest, Forward_DeliversToMatchingSubscriptions)
{
    auto notes = make_shared<EventStream>();
    auto profiles = make_shared<EventStream>();
    Filter profileFilter;
    profileFilter.kinds = { 0 };
    router->subscribe("notes", kindOneFilters(), notes);
    router->subscribe("profiles", { profileFilter }, profiles);

    size_t delivered = router->forward(make_shared<const Event>(makeEvent("note")), relayOne);

    ASSERT_EQ(delivered, 1);
    StreamItem item;
    ASSERT_TRUE(notes->tryNext(item));
    ASSERT_EQ(item.event->content, "note");
    ASSERT_EQ(item.relay, relayOne);
    ASSERT_FALSE(profiles->tryNext(item));
}

TEST_F(SubscriptionRouterTest, Forward_DeliversEachEventOnce_PerSubscription)
{
    auto early = make_shared<EventStream>();
    router->subscribe("early", kindOneFilters(), early);
    auto event = make_shared<const Event>(makeEvent("note"));

    ASSERT_EQ(router->forward(event, relayOne), 1);

    auto late = make_shared<EventStream>();
    router->subscribe("late", kindOneFilters(), late);

    ASSERT_EQ(router->forward(event, relayTwo), 1);
    ASSERT_EQ(drainTypes(*early), vector<StreamItemType>({ StreamItemType::Event }));
    ASSERT_EQ(drainTypes(*late), vector<StreamItemType>({ StreamItemType::Event }));
    ASSERT_EQ(router->forward(event, relayOne), 0);
}

TEST_F(SubscriptionRouterTest, Subscribe_SkipsAlreadyDeliveredEvents)
{
    auto event = make_shared<const Event>(makeEvent("stored"));
    auto stream = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), stream, { event });

    ASSERT_EQ(router->forward(event, relayOne), 0);
    ASSERT_TRUE(drainTypes(*stream).empty());
}

TEST_F(SubscriptionRouterTest, Subscribe_SendsRequestFilters_ButMatchesOriginalFilters)
{
    Filter narrowed = kindOneFilters().front();
    narrowed.since = 1800000000;
    vector<Filter> requestFilters = { narrowed };

    EXPECT_CALL(*mockDirectory, openSubscription(relayOne, "sub-1", requestFilters)).Times(1);
    EXPECT_CALL(*mockDirectory, openSubscription(relayTwo, "sub-1", requestFilters)).Times(1);

    auto stream = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), stream, {}, requestFilters);

    ASSERT_EQ(router->forward(make_shared<const Event>(makeEvent("older", 1, 1700000000)), relayOne), 1);
}

TEST_F(SubscriptionRouterTest, SelectionPolicy_ChoosesServingRelays)
{
    router = make_shared<SubscriptionRouter>(mockDirectory, make_shared<MarkedRelaysPolicy>());
    ON_CALL(*mockDirectory, connectedRelays()).WillByDefault(Return(vector<string>({ relayOne, "wss://marked.relay" })));

    EXPECT_CALL(*mockDirectory, openSubscription(relayOne, _, _)).Times(0);
    EXPECT_CALL(*mockDirectory, openSubscription("wss://marked.relay", _, _)).Times(1);

    string subscriptionId = router->subscribe(kindOneFilters());

    ASSERT_EQ(router->subscriptionRelays(subscriptionId), vector<string>({ "wss://marked.relay" }));
}

TEST_F(SubscriptionRouterTest, CloseAll_EndsEveryStream)
{
    auto first = make_shared<EventStream>();
    auto second = make_shared<EventStream>();
    router->subscribe("sub-1", kindOneFilters(), first);
    router->subscribe("sub-2", kindOneFilters(), second);

    router->closeAll("pool shutting down");

    ASSERT_EQ(router->subscriptionCount(), 0);
    ASSERT_TRUE(first->isClosed());
    ASSERT_TRUE(second->isClosed());
}
