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

#include <sentinel/sentinel.h>

#include <string.h>

static const sentinel_category g_sentinel_categories[SENTINEL_CATEGORY_COUNT] =
{
	SENTINEL_CATEGORY_CREATE,
	SENTINEL_CATEGORY_WRITE,
	SENTINEL_CATEGORY_DELETE,
	SENTINEL_CATEGORY_RENAME,
	SENTINEL_CATEGORY_CHMOD
};

static const char* g_sentinel_category_names[SENTINEL_CATEGORY_COUNT] =
{
	"create",
	"write",
	"delete",
	"rename",
	"chmod"
};

static bool sentinel_script_set( const char* script )
{
	return script != 0x0 && script[0] != '\0';
}

sentinel_category sentinel_category_at( size_t index )
{
	return g_sentinel_categories[index];
}

const char* sentinel_category_name( sentinel_category category )
{
	for( size_t i = 0; i < SENTINEL_CATEGORY_COUNT; ++i )
		if( g_sentinel_categories[i] == category )
			return g_sentinel_category_names[i];
	return 0x0;
}

void sentinel_config_reconcile( const sentinel_options* options, sentinel_config* config )
{
	memset( config, 0x0, sizeof( sentinel_config ) );
	config->loop      = options->loop;
	config->paths     = options->paths;
	config->paths_cnt = options->paths_cnt;

	config->stop_codes[0]  = 1;
	config->stop_codes[1]  = 2;
	config->stop_codes_cnt = 2;

	bool use_all = sentinel_script_set( options->script_all );
	config->enabled = options->flags & SENTINEL_CATEGORY_ALL;

	for( size_t i = 0; i < SENTINEL_CATEGORY_COUNT; ++i )
	{
		const char* script = use_all ? options->script_all : options->scripts[i];
		if( !sentinel_script_set( script ) )
			continue;

		config->actions[i] = script;
		config->enabled |= g_sentinel_categories[i];
	}
}

bool sentinel_config_is_stop_code( const sentinel_config* config, int exit_code )
{
	for( size_t i = 0; i < config->stop_codes_cnt; ++i )
		if( config->stop_codes[i] == exit_code )
			return true;
	return false;
}

unsigned int sentinel_classify( unsigned int enabled, unsigned int ops )
{
	return enabled & ops & SENTINEL_CATEGORY_ALL;
}
