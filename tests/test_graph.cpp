#include <gtest/gtest.h>

#include <algorithm>

#include "membership/Graph.hpp"
#include "membership/WireCodec.hpp"

using namespace Gossamer::Membership;

namespace {
    const std::set<NodeId> GROUP = {NodeId("a"), NodeId("b")};

    Event genesisOf(const std::string& creator) {
        return Event{NodeId(creator), std::nullopt, std::nullopt, Observation::makeGenesis(GROUP)};
    }

    Event child(const std::string& creator, const Hash& self, std::optional<Hash> other,
                Observation obs = Observation::makeSync()) {
        return Event{NodeId(creator), self, other, std::move(obs)};
    }

    class GraphTest : public ::testing::Test {
    protected:
        Graph graph;
        Hash ga;
        Hash gb;

        void SetUp() override {
            ga = graph.hashAt(graph.insert(genesisOf("a")).index);
            gb = graph.hashAt(graph.insert(genesisOf("b")).index);
        }
    };
}

TEST_F(GraphTest, InsertAssignsSequentialIndices) {
    EXPECT_EQ(graph.size(), 2u);
    EXPECT_EQ(graph.getIndex(ga), std::optional<size_t>(0));
    EXPECT_EQ(graph.getIndex(gb), std::optional<size_t>(1));
    EXPECT_TRUE(graph.contains(ga));
    EXPECT_EQ(ga, hashEvent(genesisOf("a")));
}

TEST_F(GraphTest, DuplicateInsertReturnsExistingEvent) {
    EventRef again = graph.insert(genesisOf("a"));
    EXPECT_EQ(again.index, 0u);
    EXPECT_EQ(graph.size(), 2u);
}

TEST_F(GraphTest, LookupsByIndexAndHash) {
    auto byHash = graph.getByHash(gb);
    ASSERT_TRUE(byHash.has_value());
    EXPECT_EQ(byHash->index, 1u);
    EXPECT_EQ(byHash->event->creator, NodeId("b"));

    EXPECT_FALSE(graph.getByIndex(2).has_value());
    EXPECT_FALSE(graph.getByHash(computeHash("nope")).has_value());
    EXPECT_FALSE(graph.getIndex(computeHash("nope")).has_value());
}

TEST_F(GraphTest, RefsStayValidAcrossInserts) {
    EventRef first = *graph.getByIndex(0);
    Hash prev = ga;
    for (int i = 0; i < 100; ++i) {
        prev = graph.hashAt(graph.insert(child("a", prev, std::nullopt)).index);
    }
    EXPECT_EQ(first.event->creator, NodeId("a"));
    EXPECT_EQ(first.event->observation.kind, ObservationKind::GENESIS);
}

TEST_F(GraphTest, UnknownParentIsRejected) {
    Hash missing = computeHash("missing");
    try {
        graph.insert(child("a", ga, missing));
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.kind(), GraphError::Kind::UNKNOWN_PARENT);
    }
    EXPECT_FALSE(graph.parentsPresent(child("a", ga, missing)));
    EXPECT_TRUE(graph.parentsPresent(child("a", ga, gb)));
    EXPECT_EQ(graph.size(), 2u);
}

TEST_F(GraphTest, SelfParentMustBelongToCreator) {
    try {
        graph.insert(child("a", gb, std::nullopt));
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.kind(), GraphError::Kind::INVALID_SELF_PARENT);
    }
}

TEST_F(GraphTest, StructuralRulesForGenesisAndRoots) {
    Event orphanAdd{NodeId("a"), std::nullopt, std::nullopt, Observation::makeAdd(NodeId("c"))};
    try {
        graph.insert(orphanAdd);
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.kind(), GraphError::Kind::INVALID_EVENT);
    }

    Event genesisWithParent{NodeId("c"), std::nullopt, ga, Observation::makeGenesis(GROUP)};
    try {
        graph.insert(genesisWithParent);
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.kind(), GraphError::Kind::INVALID_EVENT);
    }
}

TEST_F(GraphTest, LatestByTracksHighestIndexPerCreator) {
    Hash a1 = graph.hashAt(graph.insert(child("a", ga, gb)).index);
    graph.insert(child("b", gb, a1));

    EXPECT_EQ(graph.latestBy(NodeId("a"))->index, 2u);
    EXPECT_EQ(graph.latestBy(NodeId("b"))->index, 3u);
    EXPECT_FALSE(graph.latestBy(NodeId("z")).has_value());

    std::vector<NodeId> creators = graph.creators();
    EXPECT_EQ(creators, (std::vector<NodeId>{NodeId("a"), NodeId("b")}));
}

TEST_F(GraphTest, AncestorsVisitEachEventOnceInDescendingOrder) {
    // a1 -> (ga, gb); b1 -> (gb, a1); a2 -> (a1, b1)
    Hash a1 = graph.hashAt(graph.insert(child("a", ga, gb)).index);
    Hash b1 = graph.hashAt(graph.insert(child("b", gb, a1)).index);
    EventRef a2 = graph.insert(child("a", a1, b1));

    std::vector<EventRef> visited = graph.ancestors(a2).collect();
    std::vector<size_t> indices;
    for (const auto& ref : visited) indices.push_back(ref.index);

    EXPECT_EQ(indices, (std::vector<size_t>{4, 3, 2, 1, 0}));
}

TEST_F(GraphTest, AncestorsExcludeUnrelatedEvents) {
    Hash a1 = graph.hashAt(graph.insert(child("a", ga, std::nullopt)).index);
    graph.insert(child("b", gb, std::nullopt));
    EventRef a2 = graph.insert(child("a", a1, std::nullopt));

    std::vector<size_t> indices;
    for (const auto& ref : graph.ancestors(a2).collect()) indices.push_back(ref.index);

    EXPECT_EQ(indices, (std::vector<size_t>{4, 2, 0}));
}

TEST_F(GraphTest, AncestorsOfGenesisIsItself) {
    SubGraphIter it = graph.ancestors(*graph.getByIndex(1));
    auto first = it.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->index, 1u);
    EXPECT_FALSE(it.next().has_value());
}

TEST_F(GraphTest, EventWithStrayObservationFieldIsRejected) {
    // Ugyanaz a kódolás lenne, mint a meglévő genezisé: be sem kerülhet.
    Event forged = genesisOf("a");
    forged.observation.subject = NodeId("b");

    try {
        graph.insert(forged);
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.kind(), GraphError::Kind::INVALID_EVENT);
    }
    EXPECT_EQ(graph.size(), 2u);
}

TEST(ObservationOrder, KindThenSubjectThenGenesis) {
    const NodeId a("a");
    const NodeId b("b");

    std::set<Observation> ordered = {
        Observation::makeSync(),
        Observation::makeRemove(a),
        Observation::makeAdd(b),
        Observation::makeGenesis({a, b}),
        Observation::makeAdd(a),
        Observation::makeGenesis({a}),
    };

    std::vector<Observation> expected = {
        Observation::makeGenesis({a}),
        Observation::makeGenesis({a, b}),
        Observation::makeAdd(a),
        Observation::makeAdd(b),
        Observation::makeRemove(a),
        Observation::makeSync(),
    };
    EXPECT_TRUE(std::equal(ordered.begin(), ordered.end(), expected.begin(), expected.end()));

    EXPECT_LT(Observation::makeAdd(b), Observation::makeRemove(a));
    EXPECT_FALSE(Observation::makeAdd(a) < Observation::makeAdd(a));
    EXPECT_NE(Observation::makeAdd(a), Observation::makeRemove(a));
}
