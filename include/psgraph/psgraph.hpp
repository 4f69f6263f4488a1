#pragma once

#include <psgraph/chart.hpp>
#include <psgraph/color.hpp>
#include <psgraph/data_table.hpp>
#include <psgraph/document.hpp>
#include <psgraph/errors.hpp>
#include <psgraph/geometry.hpp>
#include <psgraph/key.hpp>
#include <psgraph/layout.hpp>
#include <psgraph/logger.hpp>
#include <psgraph/number_format.hpp>
#include <psgraph/paper.hpp>
#include <psgraph/scale.hpp>
#include <psgraph/style.hpp>
#include <psgraph/transform.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   psgraph::BarChart chart;
//   chart.build_csv("readings.csv");
//   chart.write("readings.ps");
//
// For several charts in one document, share a PostScriptFile:
//
//   psgraph::PostScriptFile file(psgraph::chart_document_config());
//   psgraph::XYChart a(file), b(file);
//   a.build(first);
//   file.new_page();
//   b.build(second);
//
// Layout without output: psgraph::Layout(options, file.page_bounding_box()).
