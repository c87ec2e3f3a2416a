#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "relaydeck/pool/ingestion_pipeline.hpp"
#include "relaydeck/store/memory_event_store.hpp"
#include "test_support.hpp"

using namespace relaydeck::data;
using namespace relaydeck::pool;
using namespace relaydeck::store;
using namespace relaydeck_test;
using namespace std;
using namespace ::testing;

class MockEventForwarder : public IEventForwarder
{
public:
    MOCK_METHOD(size_t, forward, (std::shared_ptr<const Event> event, const std::string& relay), (override));
};

class IngestionPipelineTest : public testing::Test
{
protected:
    shared_ptr<NiceMock<MockEventForwarder>> mockForwarder;
    shared_ptr<MemoryEventStore> store;
    PoolConfig config;

    vector<PoolEvent> poolEvents;
    mutex poolEventsMutex;

    void SetUp() override
    {
        mockForwarder = make_shared<NiceMock<MockEventForwarder>>();
        ON_CALL(*mockForwarder, forward(_, _)).WillByDefault(Return(1));
        store = make_shared<MemoryEventStore>();
    };

    function<void(const PoolEvent&)> recorder()
    {
        return [this](const PoolEvent& poolEvent)
        {
            lock_guard<mutex> lock(this->poolEventsMutex);
            this->poolEvents.push_back(poolEvent);
        };
    };

    vector<PoolEventType> recordedTypes()
    {
        lock_guard<mutex> lock(this->poolEventsMutex);
        vector<PoolEventType> types;
        for (const auto& poolEvent : this->poolEvents)
        {
            types.push_back(poolEvent.type);
        }
        return types;
    };
};

TEST_F(IngestionPipelineTest, Accept_ForwardsAndStores_NewEvents)
{
    IngestionPipeline pipeline(mockForwarder, store, config, recorder());
    pipeline.start();
    auto event = make_shared<const Event>(makeEvent("fresh"));

    EXPECT_CALL(*mockForwarder, forward(event, "wss://relay.one")).Times(1);

    ASSERT_TRUE(pipeline.accept(event, "wss://relay.one"));
    ASSERT_TRUE(pipeline.hasSeen(event->id));
    ASSERT_TRUE(eventually([this]() { return store->size() == 1; }));

    pipeline.stop();
}

TEST_F(IngestionPipelineTest, Accept_StoresDuplicatesOnce_FromAnyRelay)
{
    IngestionPipeline pipeline(mockForwarder, store, config, recorder());
    pipeline.start();
    auto event = make_shared<const Event>(makeEvent("twice"));

    // Later copies are still offered to the router for subscriptions that lack them.
    EXPECT_CALL(*mockForwarder, forward(_, _)).Times(3);

    ASSERT_TRUE(pipeline.accept(event, "wss://relay.one"));
    ASSERT_FALSE(pipeline.accept(event, "wss://relay.two"));
    ASSERT_FALSE(pipeline.accept(make_shared<const Event>(*event), "wss://relay.one"));

    pipeline.stop();
    ASSERT_EQ(pipeline.storeWriter()->written(), 1);
}

TEST_F(IngestionPipelineTest, Accept_WorksWithoutStore)
{
    IngestionPipeline pipeline(mockForwarder, nullptr, config, recorder());
    pipeline.start();

    ASSERT_TRUE(pipeline.accept(make_shared<const Event>(makeEvent("unstored")), "wss://relay.one"));
    ASSERT_EQ(pipeline.storeWriter(), nullptr);

    vector<Filter> filters = { Filter() };
    EventStream stream;
    ASSERT_TRUE(pipeline.backfill(filters, stream).empty());

    pipeline.stop();
}

TEST_F(IngestionPipelineTest, FullStoreQueue_RaisesBackpressure_ButStillForwards)
{
    config.storeQueueDepth = 1;
    IngestionPipeline pipeline(mockForwarder, store, config, recorder());

    EXPECT_CALL(*mockForwarder, forward(_, _)).Times(2);

    // The writer is not started, so the first event fills the queue.
    ASSERT_TRUE(pipeline.accept(make_shared<const Event>(makeEvent("queued")), "wss://relay.one"));
    ASSERT_TRUE(pipeline.accept(make_shared<const Event>(makeEvent("dropped")), "wss://relay.one"));

    ASSERT_EQ(recordedTypes(), vector<PoolEventType>({ PoolEventType::StoreBackpressure }));
    ASSERT_EQ(poolEvents.front().eventId, makeEvent("dropped").id);

    pipeline.start();
    pipeline.stop();
    ASSERT_EQ(store->size(), 1);
}

TEST_F(IngestionPipelineTest, FailingStore_IsRetried_ThenDegraded)
{
    auto mockStore = make_shared<NiceMock<MockEventStore>>();
    config.storeRetries = 2;
    IngestionPipeline pipeline(mockForwarder, mockStore, config, recorder());

    EXPECT_CALL(*mockStore, put(_)).Times(3).WillRepeatedly(Throw(StoreError("disk full")));

    pipeline.start();
    pipeline.accept(make_shared<const Event>(makeEvent("unlucky")), "wss://relay.one");
    pipeline.stop();

    ASSERT_EQ(recordedTypes(), vector<PoolEventType>({ PoolEventType::IngestionDegraded }));
    ASSERT_EQ(poolEvents.front().message, "disk full");
    ASSERT_EQ(pipeline.storeWriter()->abandoned(), 1);
}

TEST_F(IngestionPipelineTest, FlakyStore_SucceedsWithinRetries)
{
    auto mockStore = make_shared<NiceMock<MockEventStore>>();
    IngestionPipeline pipeline(mockForwarder, mockStore, config, recorder());

    EXPECT_CALL(*mockStore, put(_))
        .WillOnce(Throw(StoreError("busy")))
        .WillOnce(Return());

    pipeline.start();
    pipeline.accept(make_shared<const Event>(makeEvent("persistent")), "wss://relay.one");
    pipeline.stop();

    ASSERT_TRUE(recordedTypes().empty());
    ASSERT_EQ(pipeline.storeWriter()->written(), 1);
}

TEST_F(IngestionPipelineTest, StoreThrowingOtherErrors_IsRetried_WithoutEndingTheWriter)
{
    auto mockStore = make_shared<NiceMock<MockEventStore>>();
    config.storeRetries = 1;
    IngestionPipeline pipeline(mockForwarder, mockStore, config, recorder());

    EXPECT_CALL(*mockStore, put(_))
        .WillOnce(Throw(runtime_error("driver fault")))
        .WillOnce(Throw(runtime_error("driver fault")))
        .WillOnce(Return());

    pipeline.start();
    pipeline.accept(make_shared<const Event>(makeEvent("first")), "wss://relay.one");
    pipeline.accept(make_shared<const Event>(makeEvent("second")), "wss://relay.one");
    pipeline.stop();

    ASSERT_EQ(recordedTypes(), vector<PoolEventType>({ PoolEventType::IngestionDegraded }));
    ASSERT_EQ(poolEvents.front().message, "driver fault");
    ASSERT_EQ(pipeline.storeWriter()->abandoned(), 1);
    ASSERT_EQ(pipeline.storeWriter()->written(), 1);
}

TEST_F(IngestionPipelineTest, Backfill_DeliversEachStoredEventOnce_AndMarksItSeen)
{
    Event note = makeEvent("stored note");
    Event profile = makeEvent("stored profile", 0);
    store->put(note);
    store->put(profile);

    IngestionPipeline pipeline(mockForwarder, store, config, recorder());

    Filter everything;
    Filter notes;
    notes.kinds = { 1 };
    EventStream stream;

    auto backfilled = pipeline.backfill({ notes, everything }, stream);
    ASSERT_EQ(backfilled.size(), 2);

    StreamItem item;
    size_t received = 0;
    while (stream.tryNext(item))
    {
        ASSERT_EQ(item.type, StreamItemType::Event);
        received++;
    }
    ASSERT_EQ(received, 2);

    ASSERT_TRUE(pipeline.hasSeen(note.id));
    ASSERT_FALSE(pipeline.accept(make_shared<const Event>(note), "wss://relay.one"));
}

TEST_F(IngestionPipelineTest, Backfill_SurvivesStoreErrors)
{
    auto mockStore = make_shared<NiceMock<MockEventStore>>();
    ON_CALL(*mockStore, query(_)).WillByDefault(Invoke([](const Filter&) -> unique_ptr<IEventCursor>
    {
        throw StoreError("index corrupt");
    }));
    IngestionPipeline pipeline(mockForwarder, mockStore, config, recorder());

    EventStream stream;
    vector<Filter> filters = { Filter() };

    ASSERT_TRUE(pipeline.backfill(filters, stream).empty());
}

TEST_F(IngestionPipelineTest, Constructor_Throws_WithoutForwarder)
{
    ASSERT_THROW(IngestionPipeline(nullptr, store, config, recorder()), invalid_argument);
}
