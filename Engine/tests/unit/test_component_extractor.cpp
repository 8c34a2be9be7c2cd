/**
 * @file test_component_extractor.cpp
 * @brief Lexical component extraction and the concept graph
 */

#include <gtest/gtest.h>
#include <cognitive/component_extractor.hpp>
#include <cognitive/concept_graph.hpp>
#include <cognitive/context.hpp>

using namespace Russell;

TEST(ComponentExtractorTest, EntityAndRelation) {
    LexicalComponentExtractor extractor;
    auto c = extractor.extract("John is a teacher");

    EXPECT_EQ(c.entities, std::vector<std::string>{"John"});
    EXPECT_EQ(c.relations, std::vector<std::string>{"is"});
    EXPECT_TRUE(c.quantifiers.empty());
    EXPECT_TRUE(c.actions.empty());
    EXPECT_EQ(c.total(), 2u);
    EXPECT_EQ(extractor.name(), "lexical");
}

TEST(ComponentExtractorTest, SyllogismComponents) {
    LexicalComponentExtractor extractor;
    auto c = extractor.extract("If all men are mortal and Socrates is a man, then Socrates is mortal");

    EXPECT_EQ(c.entities, (std::vector<std::string>{"Socrates", "Socrates"}));
    EXPECT_EQ(c.relations, (std::vector<std::string>{"is", "is"}));
    EXPECT_EQ(c.quantifiers, std::vector<std::string>{"all"});
    EXPECT_EQ(c.connectives, (std::vector<std::string>{"if", "and", "then"}));
    EXPECT_TRUE(c.has_connective("if"));
    EXPECT_TRUE(c.has_connective("then"));
    EXPECT_EQ(c.flatten(), "if all and socrates is then socrates is");
}

TEST(ComponentExtractorTest, PronounsActionsAndModalities) {
    LexicalComponentExtractor extractor;
    auto c = extractor.extract("she was walking and talked; it is possible");

    EXPECT_EQ(c.entities, (std::vector<std::string>{"she", "it"}));
    EXPECT_EQ(c.actions, (std::vector<std::string>{"walking", "talked"}));
    EXPECT_EQ(c.modalities, std::vector<std::string>{"possible"});
    EXPECT_TRUE(LexicalComponentExtractor::is_pronoun("They"));
    EXPECT_FALSE(LexicalComponentExtractor::is_pronoun("Them"));
}

TEST(ComponentExtractorTest, ShortCapitalizedTokensAreNotEntities) {
    LexicalComponentExtractor extractor;
    auto c = extractor.extract("Ok No");

    EXPECT_TRUE(c.entities.empty());
    EXPECT_EQ(c.quantifiers, std::vector<std::string>{"no"});
}

TEST(ComponentExtractorTest, EmptyQuery) {
    LexicalComponentExtractor extractor;
    auto c = extractor.extract("   ");
    EXPECT_EQ(c.total(), 0u);
    EXPECT_EQ(c.flatten(), "");
}

TEST(ConceptGraphTest, SeededWithLogicalOperators) {
    auto graph = ConceptGraph::with_logical_operators();

    EXPECT_EQ(graph.size(), 18u);
    EXPECT_TRUE(graph.contains("IMPLIES"));
    EXPECT_EQ(graph.neighbors("IMPLIES"), std::vector<std::string>{"operator_IMPLIES"});
    EXPECT_TRUE(graph.neighbors("operator_IMPLIES").empty());
}

TEST(ConceptGraphTest, RelateAndLookup) {
    ConceptGraph graph;
    graph.relate("Socrates", "Mortal");
    graph.relate("Socrates", "Man");
    graph.add_concept("Plato");

    EXPECT_EQ(graph.size(), 4u);
    EXPECT_EQ(graph.neighbors("Socrates"), (std::vector<std::string>{"Man", "Mortal"}));
    EXPECT_TRUE(graph.contains("Mortal"));
    EXPECT_TRUE(graph.neighbors("Nobody").empty());

    auto match = graph.find_case_insensitive("plato");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(*match, "Plato");
    EXPECT_FALSE(graph.find_case_insensitive("aristotle").has_value());
}

TEST(ContextTest, CacheKeysAreStructurallyUnique) {
    Context empty = Context::object();
    Context a = {{"k", "v"}};
    Context b = {{"b", 1}};
    Context unsorted = {{"z", 1}, {"a", 2}};

    EXPECT_EQ(make_cache_key("John  is", empty, 3), make_cache_key(" John is ", empty, 3));
    EXPECT_NE(make_cache_key("John is", empty, 3), make_cache_key("John is", empty, 4));
    EXPECT_NE(make_cache_key("John is", empty, 3), make_cache_key("John is", a, 3));
    EXPECT_NE(make_cache_key("a|1:b", empty, 3), make_cache_key("a", b, 3));
    EXPECT_EQ(normalize_context(Context()), "{}");
    EXPECT_EQ(normalize_context(unsorted), "{\"a\":2,\"z\":1}");
}
