// uyd.hpp - Unity YAML Document (uyd)
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

//========================================================================
// uyd Core Principles:
//========================================================================
//
// The Byte-Fidelity Principle
// ---------------------------
// A document that is loaded and saved unedited is the same file.
// Unity's dialect is kept as text; nothing is normalised on the way
// through.
//
//
// The Local-Edit Principle
// ------------------------
// An edit touches the lines it names and nothing else. Sibling fields,
// comments and formatting of untouched blocks stay as authored.
//
//
// The Consistent-Hierarchy Principle
// ----------------------------------
// m_Father and m_Children always agree after a structural edit.
// Preconditions are checked before the first write; a refused edit
// leaves the document unchanged.
//
//========================================================================


#ifndef UYD_UNITY_YAML_DOCUMENT
#define UYD_UNITY_YAML_DOCUMENT

#include "uyd_core.hpp"
#include "uyd_log.hpp"
#include "uyd_tokenizer.hpp"
#include "uyd_document.hpp"
#include "uyd_fields.hpp"
#include "uyd_hierarchy.hpp"
#include "uyd_serializer.hpp"
#include "uyd_query.hpp"
#include "uyd_overrides.hpp"
#include "uyd_guid_resolver.hpp"
#include "uyd_editor.hpp"
#include "uyd_trace.hpp"

#endif
