#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "application/MindmapExportService.hpp"
#include "application/MindmapPipeline.hpp"
#include "application/SegmentNormalizer.hpp"
#include "test/TestDoubles.hpp"

using namespace thoughtflow;
using namespace thoughtflow::application;

namespace {

const std::vector<std::string> kDocument = {
    "Solar panels convert sunlight into electricity.",
    "Wind turbines harvest energy from moving air.",
    "Coral reefs shelter a quarter of marine species.",
    "Ocean currents carry heat toward the poles.",
    "Battery storage smooths out renewable supply."
};

domain::MindmapSettings FastSettings() {
    domain::MindmapSettings settings;
    settings.maxDepth = 2;
    settings.minSize = 2;
    settings.interCallDelayMs = 0;
    settings.generationRetries = 1;
    settings.embeddingBatchSize = 2;
    return settings;
}

std::shared_ptr<generation::CallPacer> NoSleepPacer(std::vector<std::chrono::milliseconds>& sleeps) {
    return test::MakeRecordingPacer(sleeps);
}

} // namespace

int main() {
    std::cout << "[Test] Starting MindmapPipeline Test..." << std::endl;
    std::vector<std::chrono::milliseconds> sleeps;

    // 1. Normalization
    {
        auto segments = SegmentNormalizer::Normalize({"  Short  ", "A   perfectly\tfine\x01 segment", "", "tiny"});
        assert(segments.size() == 1);
        assert(segments[0].index == 0);
        assert(segments[0].cleanedText == "A perfectly fine segment");
        auto lines = SegmentNormalizer::SplitLines("first line\n\n   \nsecond line\n");
        assert((lines == std::vector<std::string>{"first line", "second line"}));
        std::cout << "[PASS] Segment normalization." << std::endl;
    }

    // 2. Input errors
    {
        auto embedder = std::make_shared<test::FixedEmbeddingProvider>(test::AxisEmbeddings(5, 3));
        auto generator = test::ScriptedGenerationProvider::Constant("Topic");
        MindmapPipeline pipeline(embedder, generator, FastSettings(), NoSleepPacer(sleeps));

        auto empty = pipeline.run(std::vector<std::string>{});
        assert(!empty && empty.error().kind == domain::ErrorKind::InputError);

        auto tooShort = pipeline.run(std::vector<std::string>{"hi", "   ", "ok then"});
        assert(!tooShort && tooShort.error().kind == domain::ErrorKind::InputError);
        assert(embedder->batchSizes.empty());

        auto segments = SegmentNormalizer::Normalize(kDocument);
        auto mismatch = pipeline.run(segments, test::AxisEmbeddings(4, 3));
        assert(!mismatch && mismatch.error().kind == domain::ErrorKind::InputError);

        auto ragged = test::AxisEmbeddings(5, 3);
        ragged[3].push_back(0.5f);
        auto raggedResult = pipeline.run(segments, ragged);
        assert(!raggedResult && raggedResult.error().kind == domain::ErrorKind::InputError);

        auto nan = test::AxisEmbeddings(5, 3);
        nan[1][0] = std::numeric_limits<float>::quiet_NaN();
        auto nanResult = pipeline.run(segments, nan);
        assert(!nanResult && nanResult.error().kind == domain::ErrorKind::InputError);

        auto reordered = segments;
        reordered[0].index = 7;
        assert(MindmapPipeline::ValidateInput(reordered, test::AxisEmbeddings(5, 3)));
        assert(!MindmapPipeline::ValidateInput(segments, test::AxisEmbeddings(5, 3)));
        assert(generator->calls() == 0);
        std::cout << "[PASS] Input errors." << std::endl;
    }

    // 3. Unavailable embedder
    {
        auto embedder = std::make_shared<test::FixedEmbeddingProvider>(domain::EmbeddingMatrix{}, false);
        auto generator = test::ScriptedGenerationProvider::Constant("Topic");
        MindmapPipeline pipeline(embedder, generator, FastSettings(), NoSleepPacer(sleeps));
        auto result = pipeline.run(kDocument);
        assert(!result);
        assert(result.error().kind == domain::ErrorKind::ProviderUnavailable);
        assert(generator->calls() == 0);
        std::cout << "[PASS] Unavailable embedder." << std::endl;
    }

    // 4. Full run with junk generation: every node falls back, the tree stays valid
    {
        auto embedder = std::make_shared<test::FixedEmbeddingProvider>(test::AxisEmbeddings(5, 3));
        auto generator = test::ScriptedGenerationProvider::Constant("<think>no answer</think>");
        MindmapPipeline pipeline(embedder, generator, FastSettings(), NoSleepPacer(sleeps));
        auto result = pipeline.run(kDocument);
        assert(result);
        const MindmapResult& mindmap = result.value();

        assert((embedder->batchSizes == std::vector<int>{2, 2, 1}));
        assert(mindmap.segments.size() == 5);
        assert(mindmap.validationErrors.empty());
        assert(mindmap.language == "English");
        assert(mindmap.enrichment.fallbackLabels == static_cast<int>(mindmap.tree.size()));
        assert(mindmap.title.title == enrichment::RootNamer::kFallbackTitle);
        assert(!mindmap.title.generated);

        for (domain::NodeIndex i = 0; i < mindmap.tree.size(); ++i) {
            assert(mindmap.tree.node(i).label && !mindmap.tree.node(i).label->empty());
        }

        auto j = MindmapExportService::ToJson(mindmap);
        assert(j["title"] == "Untitled Mindmap");
        assert(j["overview"] == "No overview available.");
        assert(j["rtl"] == false);
        assert(j["root"]["id"] == "root");
        assert(j["root"]["metadata"]["depth"] == 0);
        assert(j["root"]["metadata"]["member_indices"].size() == 5);
        assert(j.contains("relationshipStats"));
        assert(j["enrichment"]["nodes"] == static_cast<int>(mindmap.tree.size()));

        const std::string mermaid = MindmapExportService::ToMermaidMindmap(mindmap);
        assert(mermaid.rfind("```mermaid\nmindmap\n  root((Untitled Mindmap))\n", 0) == 0);
        assert(mermaid.find("root_0[") != std::string::npos);
        std::cout << "[PASS] Full run with fallbacks (" << mindmap.tree.size() << " nodes)." << std::endl;
    }

    // 5. Language code is canonicalized and reaches the prompts
    {
        auto embedder = std::make_shared<test::FixedEmbeddingProvider>(test::AxisEmbeddings(5, 3));
        auto generator = test::ScriptedGenerationProvider::Constant("موضوع الطاقة");
        auto settings = FastSettings();
        settings.language = "ar";
        MindmapPipeline pipeline(embedder, generator, settings, NoSleepPacer(sleeps));
        assert(pipeline.settings().language == "Arabic");

        auto result = pipeline.run(kDocument);
        assert(result);
        assert(result.value().language == "Arabic");
        assert(result.value().enrichment.generatedLabels == static_cast<int>(result.value().tree.size()));
        assert(generator->prompts.front().find("in Arabic") != std::string::npos);

        auto j = MindmapExportService::ToJson(result.value());
        assert(j["rtl"] == true);
        assert(j["overview"] == "لا تتوفر نظرة عامة.");
        std::cout << "[PASS] Arabic run." << std::endl;
    }

    // 6. A null template set falls back to the built-ins instead of failing
    {
        auto embedder = std::make_shared<test::FixedEmbeddingProvider>(test::AxisEmbeddings(5, 3));
        auto generator = test::ScriptedGenerationProvider::Constant("Renewable energy");
        MindmapPipeline pipeline(embedder, generator, FastSettings(), NoSleepPacer(sleeps), nullptr);
        auto result = pipeline.run(kDocument);
        assert(result);
        assert(result.value().enrichment.sentinelNodes == 0);
        assert(result.value().enrichment.generatedLabels == static_cast<int>(result.value().tree.size()));
        assert(generator->prompts.front().find("Write a short topic label") != std::string::npos);
        std::cout << "[PASS] Null templates use the built-ins." << std::endl;
    }

    std::cout << "[PASS] MindmapPipeline Test." << std::endl;
    return 0;
}
