/*
   A small tool for running scripts when watched files change.

   version 0.1, october, 2026

   Copyright (C) 2026- The sentinel authors

   This software is provided 'as-is', without any express or implied
   warranty.  In no event will the authors be held liable for any damages
   arising from the use of this software.

   Permission is granted to anyone to use this software for any purpose,
   including commercial applications, and to alter it and redistribute it
   freely, subject to the following restrictions:

   1. The origin of this software must not be misrepresented; you must not
      claim that you wrote the original software. If you use this software
      in a product, an acknowledgment in the product documentation would be
      appreciated but is not required.
   2. Altered source versions must be plainly marked as such, and must not be
      misrepresented as being the original software.
   3. This notice may not be removed or altered from any source distribution.

   The sentinel authors
*/

#ifndef SENTINEL_H_INCLUDED
#define SENTINEL_H_INCLUDED

#include <sentinel/watch.h>

#ifdef __cplusplus
extern "C" {
#endif  // __cplusplus

/**
 * Name of the environment variable holding the triggered category for a script.
 */
#define SENTINEL_ENV_ACTION "SENTINEL_ACTION"

/**
 * Name of the environment variable holding the affected path for a script.
 */
#define SENTINEL_ENV_PATH "SENTINEL_PATH"

/**
 * Capacity of sentinel_config::stop_codes.
 */
#define SENTINEL_MAX_STOP_CODES 8

/**
 * Categories a user can act on, in dispatch order. Shares bit-values with sentinel_watch_op.
 */
enum sentinel_category
{
	SENTINEL_CATEGORY_CREATE = SENTINEL_OP_CREATE,
	SENTINEL_CATEGORY_WRITE  = SENTINEL_OP_WRITE,
	SENTINEL_CATEGORY_DELETE = SENTINEL_OP_REMOVE,
	SENTINEL_CATEGORY_RENAME = SENTINEL_OP_RENAME,
	SENTINEL_CATEGORY_CHMOD  = SENTINEL_OP_CHMOD,

	SENTINEL_CATEGORY_ALL = SENTINEL_OP_ALL
};

/**
 * Number of categories, size of the per-category script tables.
 */
enum
{
	SENTINEL_CATEGORY_COUNT = 5
};

/**
 * Startup input as given by the user, see sentinel_config_reconcile().
 */
struct sentinel_options
{
	unsigned int flags;                              ///< explicitly requested categories, bitmask of sentinel_category.
	const char*  scripts[SENTINEL_CATEGORY_COUNT];   ///< script per category indexed in dispatch order, 0x0 or "" for none.
	const char*  script_all;                         ///< script for all categories, overrides scripts[]. 0x0 or "" for none.
	bool         loop;                               ///< keep watching after a dispatch.

	const char* const* paths;
	size_t             paths_cnt;
};

/**
 * Resolved configuration, immutable once sentinel_config_reconcile() returned it.
 */
struct sentinel_config
{
	unsigned int enabled;                            ///< categories to dispatch, bitmask of sentinel_category.
	const char*  actions[SENTINEL_CATEGORY_COUNT];   ///< script per category indexed in dispatch order, 0x0 for none.
	bool         loop;

	const char* const* paths;
	size_t             paths_cnt;

	int    stop_codes[SENTINEL_MAX_STOP_CODES];      ///< script exit codes that shut the watcher down with status 0.
	size_t stop_codes_cnt;
};

/**
 * Resolve startup options into a configuration. The all-categories script replaces every per-category
 * script and every category with a script gets enabled. Stop codes default to 1 and 2.
 * Strings and paths are referenced, not copied.
 */
void sentinel_config_reconcile( const sentinel_options* options, sentinel_config* config );

/**
 * @return true if a script exiting with exit_code should shut the watcher down.
 */
bool sentinel_config_is_stop_code( const sentinel_config* config, int exit_code );

/**
 * @return category for index in dispatch order, index < SENTINEL_CATEGORY_COUNT.
 */
sentinel_category sentinel_category_at( size_t index );

/**
 * @return "create", "write", "delete", "rename" or "chmod", 0x0 for anything that is not a single category.
 */
const char* sentinel_category_name( sentinel_category category );

/**
 * @return the categories of ops that are enabled, a bitmask of sentinel_category.
 */
unsigned int sentinel_classify( unsigned int enabled, unsigned int ops );

/**
 * Everything a launched script gets to know about an event.
 */
struct sentinel_launch_context
{
	const char* action; ///< category name.
	const char* path;   ///< affected path as reported by the watch source.
	const char* script;
};

/**
 * How a child terminated.
 */
struct sentinel_child_status
{
	int exit_code;   ///< exit code if the child exited, otherwise -1.
	int term_signal; ///< signal that killed the child, otherwise 0.
};

enum sentinel_launch_result
{
	SENTINEL_LAUNCH_EXITED,      ///< script ran to completion, see status.
	SENTINEL_LAUNCH_NOT_STARTED, ///< script could not be started.
	SENTINEL_LAUNCH_ENV_FAILED   ///< the environment for the script could not be built.
};

/**
 * Runs scripts, sentinel_dispatch() uses the spawning launcher if 0x0 is passed.
 */
struct sentinel_launcher
{
	/**
	 * Run ctx->script synchronously with the context in its environment.
	 *
	 * @param status filled in if SENTINEL_LAUNCH_EXITED is returned.
	 */
	sentinel_launch_result ( *launch )( sentinel_launcher* launcher, const sentinel_launch_context* ctx, sentinel_child_status* status );
};

/**
 * Launcher running "bash <script>" with SENTINEL_ACTION and SENTINEL_PATH set in the child environment.
 */
sentinel_launcher* sentinel_default_launcher();

enum sentinel_dispatch_result
{
	SENTINEL_DISPATCH_NONE,  ///< no enabled category matched the event.
	SENTINEL_DISPATCH_DONE,  ///< one or more categories were dispatched.
	SENTINEL_DISPATCH_STOP,  ///< a script exited with a stop code, nothing after it was dispatched.
	SENTINEL_DISPATCH_FATAL  ///< a script environment could not be built, nothing after it was dispatched.
};

/**
 * Classify an event and run the script of every matching category in dispatch order.
 */
sentinel_dispatch_result sentinel_dispatch( const sentinel_config* config, sentinel_launcher* launcher, const char* path, unsigned int ops );

/**
 * Register all configured paths with source, drain it on a background thread and block until done.
 *
 * @param launcher to run scripts with or 0x0 for sentinel_default_launcher().
 *
 * @return process exit status.
 */
int sentinel_run( const sentinel_config* config, sentinel_source* source, sentinel_launcher* launcher );

#ifdef __cplusplus
}
#endif  // __cplusplus

#endif // SENTINEL_H_INCLUDED
