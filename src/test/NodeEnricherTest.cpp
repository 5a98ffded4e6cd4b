#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/clustering/TreeBuilder.hpp"
#include "application/enrichment/NodeEnricher.hpp"
#include "application/enrichment/RootNamer.hpp"
#include "test/TestDoubles.hpp"

using namespace thoughtflow;
using namespace thoughtflow::application;
using namespace thoughtflow::application::enrichment;

namespace {

std::vector<domain::TextSegment> MakeSegments(const std::vector<std::string>& texts) {
    std::vector<domain::TextSegment> segments;
    for (std::size_t i = 0; i < texts.size(); ++i) {
        segments.push_back({static_cast<int>(i), texts[i], texts[i]});
    }
    return segments;
}

domain::MindmapSettings FastSettings() {
    domain::MindmapSettings settings;
    settings.maxDepth = 2;
    settings.minSize = 2;
    settings.interCallDelayMs = 0;
    settings.generationRetries = 2;
    return settings;
}

std::shared_ptr<generation::GenerationRetrier> MakeRetrier(std::shared_ptr<domain::TextGenerationProvider> provider) {
    return std::make_shared<generation::GenerationRetrier>(std::move(provider), nullptr);
}

domain::ClusterNode MakeNode(const std::string& id, int depth, std::vector<int> members, bool internal) {
    domain::ClusterNode node;
    node.id = id;
    node.depth = depth;
    node.memberIndices = std::move(members);
    node.kind = internal ? domain::NodeKind::Internal : domain::NodeKind::Leaf;
    node.leafReason = internal ? domain::LeafReason::None : domain::LeafReason::BelowMinSize;
    return node;
}

void TestFallbackLabel() {
    assert(NodeEnricher::FallbackLabel("the quick brown fox jumps over the lazy dog again and again", 10) ==
           "The quick brown fox jumps over the lazy...");
    assert(NodeEnricher::FallbackLabel("Short text", 10) == "Short text");
    assert(NodeEnricher::FallbackLabel("   \t  ", 10) == "Untitled");
    assert(NodeEnricher::FallbackLabel("one two three four", 2) == "One two...");
    std::cout << "[PASS] FallbackLabel." << std::endl;
}

void TestAllFallbacks() {
    const auto segments = MakeSegments({
        "solar panels convert sunlight", "wind turbines on the coast",
        "ocean tides move water", "geothermal heat from the crust"
    });
    auto settings = FastSettings();
    clustering::TreeBuilder builder(settings);
    auto tree = builder.build(segments, test::AxisEmbeddings(4, 2));

    auto provider = test::ScriptedGenerationProvider::Constant("<think>junk</think>");
    NodeEnricher enricher(MakeRetrier(provider), settings);
    auto report = enricher.enrich(tree, segments);

    const int nodes = static_cast<int>(tree.size());
    assert(report.nodesVisited == nodes);
    assert(report.fallbackLabels == nodes);
    assert(report.fallbackDescriptions == nodes);
    assert(report.generatedLabels == 0);
    assert(report.sentinelNodes == 0);
    assert(provider->calls() == nodes * 2 * 3);

    for (domain::NodeIndex i = 0; i < tree.size(); ++i) {
        const auto& node = tree.node(i);
        assert(node.label && !node.label->empty());
        const auto& first = segments[static_cast<std::size_t>(node.memberIndices.front())].cleanedText;
        assert(*node.label == NodeEnricher::FallbackLabel(first, settings.labelMaxWords));
        assert(*node.description == "This topic groups passages about " + *node.label + ".");
    }

    std::vector<std::string> errors;
    assert(tree.validate(errors, true));
    std::cout << "[PASS] Junk responses fall back on every node." << std::endl;
}

void TestGeneratedLabelsAndContext() {
    const auto segments = MakeSegments({
        "solar panels convert sunlight", "photovoltaic cells on roofs", "deep ocean trenches explored"
    });
    auto settings = FastSettings();
    settings.maxDepth = 3;

    domain::ClusterTree tree;
    tree.addNode(MakeNode("root", 0, {0, 1, 2}, true));
    tree.addNode(MakeNode("root_0", 1, {0, 1}, false), 0);
    tree.addNode(MakeNode("root_1", 1, {2}, false), 0);

    int labelCount = 0;
    auto provider = std::make_shared<test::ScriptedGenerationProvider>(
        [&labelCount](const std::string& prompt, int) -> std::optional<std::string> {
            if (prompt.find("Write a short topic label") != std::string::npos) {
                ++labelCount;
                return std::string("Topic ") + std::string(1, static_cast<char>('A' + labelCount - 1));
            }
            return std::string("Passages about related energy and ocean themes.");
        });

    NodeEnricher enricher(MakeRetrier(provider), settings);
    auto report = enricher.enrich(tree, segments);
    assert(report.generatedLabels == 3);
    assert(report.generatedDescriptions == 3);
    assert(*tree.root().label == "Topic A");
    assert(*tree.node(1).label == "Topic B");
    assert(*tree.node(2).label == "Topic C");

    // Root prompt sees the ROOT context, children see the root's label.
    assert(provider->prompts[0].find("Parent topic: ROOT") != std::string::npos);
    assert(provider->prompts[2].find("Parent topic: Topic A") != std::string::npos);
    assert(provider->prompts[4].find("Parent topic: Topic A") != std::string::npos);
    assert(provider->prompts[2].find("solar panels convert sunlight\nphotovoltaic cells on roofs") != std::string::npos);
    std::cout << "[PASS] Generated labels with parent context." << std::endl;
}

void TestSentinelIsolation() {
    const auto segments = MakeSegments({"first passage of text", "second passage of text"});
    auto settings = FastSettings();

    // Member 5 has no segment: enrichment of the nodes holding it throws.
    domain::ClusterTree tree;
    tree.addNode(MakeNode("root", 0, {0, 5}, true));
    tree.addNode(MakeNode("root_0", 1, {0}, false), 0);
    tree.addNode(MakeNode("root_1", 1, {5}, false), 0);

    auto provider = test::ScriptedGenerationProvider::Constant("Valid Topic");
    NodeEnricher enricher(MakeRetrier(provider), settings);
    auto report = enricher.enrich(tree, segments);

    assert(report.nodesVisited == 3);
    assert(report.sentinelNodes == 2);
    assert(*tree.root().label == NodeEnricher::kSentinelLabel);
    assert(*tree.root().description == NodeEnricher::kSentinelDescription);
    assert(*tree.node(1).label == "Valid Topic");
    assert(*tree.node(2).label == NodeEnricher::kSentinelLabel);
    std::cout << "[PASS] Failing node gets the sentinel, siblings are unaffected." << std::endl;
}

void TestRootNamer() {
    domain::ClusterTree tree;
    auto root = MakeNode("root", 0, {0, 1}, true);
    root.label = "Energy";
    root.description = "Sources of power.";
    tree.addNode(root);
    auto child = MakeNode("root_0", 1, {0}, false);
    child.label = "Solar";
    child.description = "Sunlight.";
    tree.addNode(child, 0);
    tree.addNode(MakeNode("root_1", 1, {1}, false), 0);

    assert(RootNamer::BuildOutline(tree) == "- Energy: Sources of power.\n  - Solar: Sunlight.\n");

    auto plain = RootNamer::ParseResponse("{\"title\": \"Energy Atlas\", \"summary\": \"Where power comes from.\"}");
    assert(plain && plain->title == "Energy Atlas" && plain->overview == "Where power comes from.");
    assert(plain->generated);

    auto wrapped = RootNamer::ParseResponse(
        "<think>outline first</think>Here you go: {\"title\": \"Energy\", \"summary\": \"Power.\"} Enjoy!");
    assert(wrapped && wrapped->title == "Energy");

    auto longTitle = RootNamer::ParseResponse(
        "{\"title\": \"one two three four five six seven eight\", \"summary\": \"s\"}");
    assert(longTitle && longTitle->title == "one two three four five six");

    assert(!RootNamer::ParseResponse("no json at all"));
    assert(!RootNamer::ParseResponse("{\"title\": \"Only title\"}"));
    assert(!RootNamer::ParseResponse("{\"title\": 3, \"summary\": \"x\"}"));
    assert(!RootNamer::ParseResponse("{broken"));

    auto silent = test::ScriptedGenerationProvider::Sequence({std::nullopt});
    RootNamer englishNamer(MakeRetrier(silent), "English");
    auto fallback = englishNamer.name(tree);
    assert(fallback.title == RootNamer::kFallbackTitle);
    assert(fallback.overview == "No overview available.");
    assert(!fallback.generated);

    RootNamer arabicNamer(MakeRetrier(silent), "Arabic");
    assert(arabicNamer.name(tree).overview == "لا تتوفر نظرة عامة.");

    auto answering = test::ScriptedGenerationProvider::Constant("{\"title\": \"Power\", \"summary\": \"All about energy.\"}");
    RootNamer namer(MakeRetrier(answering), "English");
    auto named = namer.name(tree);
    assert(named.generated && named.title == "Power");
    assert(answering->calls() == 1);
    assert(answering->prompts[0].find("- Energy: Sources of power.") != std::string::npos);
    std::cout << "[PASS] RootNamer." << std::endl;
}

void TestNullPromptsUseBuiltIns() {
    const auto segments = MakeSegments({"solar panels convert sunlight", "deep ocean trenches explored"});
    auto settings = FastSettings();

    domain::ClusterTree tree;
    tree.addNode(MakeNode("root", 0, {0, 1}, true));
    tree.addNode(MakeNode("root_0", 1, {0}, false), 0);
    tree.addNode(MakeNode("root_1", 1, {1}, false), 0);

    auto provider = std::make_shared<test::ScriptedGenerationProvider>(
        [](const std::string& prompt, int) -> std::optional<std::string> {
            if (prompt.find("Write a short topic label") != std::string::npos) return std::string("Energy");
            return std::string("Passages about sources of power.");
        });
    NodeEnricher enricher(MakeRetrier(provider), settings, nullptr);
    auto report = enricher.enrich(tree, segments);
    assert(report.sentinelNodes == 0);
    assert(report.generatedLabels == 3);
    assert(*tree.root().label == "Energy");

    auto answering = test::ScriptedGenerationProvider::Constant("{\"title\": \"Power\", \"summary\": \"Energy.\"}");
    RootNamer namer(MakeRetrier(answering), "English", nullptr);
    auto named = namer.name(tree);
    assert(named.generated && named.title == "Power");
    assert(answering->prompts[0].find("OUTLINE:") != std::string::npos);
    std::cout << "[PASS] Missing templates fall back to the built-ins." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Enrichment Test..." << std::endl;
    TestFallbackLabel();
    TestAllFallbacks();
    TestGeneratedLabelsAndContext();
    TestSentinelIsolation();
    TestRootNamer();
    TestNullPromptsUseBuiltIns();
    std::cout << "[PASS] Enrichment Test." << std::endl;
    return 0;
}
