//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinTools.h
// Purpose: Tools shipped with toolwire_server (echo, file_search, code_analysis, web_request, github_list_repos)
//==========================================================================================================

#pragma once

#include "toolwire/JSONTypes.h"
#include "toolwire/ToolRegistry.h"

namespace toolwire::tools {

// Registers every built-in tool, in the order listed above.
// Throws ToolwireException(DuplicateName) if one of the names is already taken.
void RegisterBuiltinTools(ToolRegistry& registry);

////////////////////////////////////////// Handlers ///////////////////////////////////////////
// Each takes the tool_request parameters object and returns the result payload.
// Invalid input and I/O failures throw; the Dispatcher reports them as ToolExecutionError.

// Returns parameters unchanged.
JSONValue Echo(const JSONValue& params);

// {directory=".", pattern="*"} -> {"files":[{path,name,is_dir,size,modified}],"count"}
// pattern is matched per path component with fnmatch(3); a "**" component spans any number of directories.
JSONValue FileSearch(const JSONValue& params);

// {path, analysis_type="syntax"|"complexity"|"dependencies"}
JSONValue CodeAnalysis(const JSONValue& params);

// {url, method="GET", headers={}, data} -> {"status_code","headers","json"|"text"}
JSONValue WebRequest(const JSONValue& params);

// {username=$GITHUB_USERNAME, per_page=30, page=1} -> {"repositories","count","page","per_page"}
JSONValue GithubListRepos(const JSONValue& params);

} // namespace toolwire::tools
