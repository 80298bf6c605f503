#include <layercast/core/diagnostics.h>
#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace layercast::core;

TEST(DiagnosticsTest, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST(DiagnosticsTest, RecordsModuleStageAndMessage) {
    DiagnosticEmitter emitter;
    emitter.warning("extract", "walk", "skipped node");

    ASSERT_EQ(emitter.size(), 1u);
    const DiagnosticEvent& event = emitter.events()[0];
    EXPECT_EQ(event.severity, Severity::Warning);
    EXPECT_EQ(event.module, "extract");
    EXPECT_EQ(event.stage, "walk");
    EXPECT_EQ(event.message, "skipped node");
}

TEST(DiagnosticsTest, FormatIncludesSeverityAndContext) {
    DiagnosticEvent event;
    event.severity = Severity::Error;
    event.module = "materialize";
    event.stage = "validate";
    event.message = "missing rootNode";
    EXPECT_EQ(format_diagnostic(event), "[error] materialize/validate: missing rootNode");
}

TEST(DiagnosticsTest, MinSeverityDropsLowerEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.info("extract", "images", "fetched 0 images");
    emitter.error("extract", "walk", "root not rendered");

    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].severity, Severity::Error);
}

TEST(DiagnosticsTest, FiltersBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.info("extract", "walk", "a");
    emitter.warning("extract", "images", "b");
    emitter.warning("materialize", "image", "c");

    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 2u);
    EXPECT_EQ(emitter.events_by_module("extract").size(), 2u);
    EXPECT_EQ(emitter.events_by_module("materialize").size(), 1u);

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}

TEST(DiagnosticsTest, StreamObserverWritesOneLinePerEvent) {
    std::ostringstream stream;
    DiagnosticEmitter emitter;
    emitter.add_observer(stream_observer(stream));
    emitter.info("extract", "walk", "3 nodes extracted");
    emitter.warning("extract", "images", "could not fetch image");

    EXPECT_EQ(stream.str(),
              "[info] extract/walk: 3 nodes extracted\n"
              "[warning] extract/images: could not fetch image\n");
}
