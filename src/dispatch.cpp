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
#include <sentinel/log.h>

sentinel_dispatch_result sentinel_dispatch( const sentinel_config* config, sentinel_launcher* launcher, const char* path, unsigned int ops )
{
	if( launcher == 0x0 )
		launcher = sentinel_default_launcher();

	unsigned int matched = sentinel_classify( config->enabled, ops );
	if( matched == 0 )
		return SENTINEL_DISPATCH_NONE;

	for( size_t i = 0; i < SENTINEL_CATEGORY_COUNT; ++i )
	{
		sentinel_category category = sentinel_category_at( i );
		if( ( matched & category ) == 0 )
			continue;

		// ... watch-only category, nothing to run ...
		const char* script = config->actions[i];
		if( script == 0x0 )
			continue;

		sentinel_launch_context ctx = { sentinel_category_name( category ), path, script };
		sentinel_child_status status = { -1, 0 };

		sentinel_log_verbose( "%s: Running '%s'\n", ctx.action, script );
		switch( launcher->launch( launcher, &ctx, &status ) )
		{
			case SENTINEL_LAUNCH_ENV_FAILED:
				sentinel_log_error( "Couldn't set environment variable for '%s'", script );
				return SENTINEL_DISPATCH_FATAL;
			case SENTINEL_LAUNCH_NOT_STARTED:
				continue;
			case SENTINEL_LAUNCH_EXITED:
				break;
		}

		if( status.term_signal != 0 )
			sentinel_log_verbose( "Error: '%s' was killed by signal %d\n", script, status.term_signal );
		else if( sentinel_config_is_stop_code( config, status.exit_code ) )
		{
			sentinel_log_verbose( "Exit code: %d\n", status.exit_code );
			return SENTINEL_DISPATCH_STOP;
		}
		else if( status.exit_code != 0 )
			sentinel_log_verbose( "Error: '%s' exited with %d\n", script, status.exit_code );
	}

	return SENTINEL_DISPATCH_DONE;
}
