/// @file richdoc.hpp
/// @brief Umbrella header for the richdoc-cpp library.
///
/// Include this single header for access to all public types:
/// AttributedText, Attribution, DocumentNode, Document, MutableDocument,
/// the change events, positions and selections, and Error.

#pragma once

#include <richdoc-cpp/attributed_text.hpp>
#include <richdoc-cpp/attribution.hpp>
#include <richdoc-cpp/change_event.hpp>
#include <richdoc-cpp/document.hpp>
#include <richdoc-cpp/document_node.hpp>
#include <richdoc-cpp/document_position.hpp>
#include <richdoc-cpp/document_selection.hpp>
#include <richdoc-cpp/error.hpp>
#include <richdoc-cpp/mutable_document.hpp>
#include <richdoc-cpp/node_id.hpp>
#include <richdoc-cpp/node_position.hpp>
#include <richdoc-cpp/value.hpp>
