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

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>

extern char** environ;

// environment handed to a script, owns vars and the two context entries but not the inherited ones.
struct sentinel_child_env
{
	char** vars;
	char*  action;
	char*  path;
};

static char* sentinel_env_entry( const char* name, const char* value )
{
	size_t name_len  = strlen( name );
	size_t value_len = strlen( value );
	char* res = (char*)malloc( name_len + 1 + value_len + 1 );
	if( res )
	{
		memcpy( res, name, name_len );
		res[name_len] = '=';
		memcpy( res + name_len + 1, value, value_len + 1 );
	}
	return res;
}

static bool sentinel_env_is( const char* entry, const char* name )
{
	size_t len = strlen( name );
	return strncmp( entry, name, len ) == 0 && entry[len] == '=';
}

static void sentinel_child_env_free( sentinel_child_env* env )
{
	free( env->vars );
	free( env->action );
	free( env->path );
}

static bool sentinel_child_env_build( sentinel_child_env* env, const sentinel_launch_context* ctx )
{
	size_t inherited = 0;
	while( environ && environ[inherited] )
		++inherited;

	env->vars   = (char**)malloc( sizeof( char* ) * ( inherited + 3 ) );
	env->action = sentinel_env_entry( SENTINEL_ENV_ACTION, ctx->action );
	env->path   = sentinel_env_entry( SENTINEL_ENV_PATH, ctx->path );
	if( env->vars == 0x0 || env->action == 0x0 || env->path == 0x0 )
	{
		sentinel_child_env_free( env );
		return false;
	}

	size_t cnt = 0;
	for( size_t i = 0; i < inherited; ++i )
		if( !sentinel_env_is( environ[i], SENTINEL_ENV_ACTION ) && !sentinel_env_is( environ[i], SENTINEL_ENV_PATH ) )
			env->vars[cnt++] = environ[i];

	env->vars[cnt++] = env->action;
	env->vars[cnt++] = env->path;
	env->vars[cnt]   = 0x0;
	return true;
}

static sentinel_launch_result sentinel_spawn_launch( sentinel_launcher*, const sentinel_launch_context* ctx, sentinel_child_status* status )
{
	sentinel_child_env env;
	if( !sentinel_child_env_build( &env, ctx ) )
		return SENTINEL_LAUNCH_ENV_FAILED;

	char* const argv[] = { (char*)"bash", (char*)ctx->script, 0x0 };

	pid_t pid;
	int err = posix_spawnp( &pid, "bash", 0x0, 0x0, argv, env.vars );
	sentinel_child_env_free( &env );
	if( err != 0 )
	{
		sentinel_log_verbose( "Error: couldn't start '%s': %s\n", ctx->script, strerror( err ) );
		return SENTINEL_LAUNCH_NOT_STARTED;
	}

	int wstatus = 0;
	while( waitpid( pid, &wstatus, 0 ) < 0 )
	{
		if( errno != EINTR )
		{
			sentinel_log_verbose( "Error: lost track of '%s': %s\n", ctx->script, strerror( errno ) );
			return SENTINEL_LAUNCH_NOT_STARTED;
		}
	}

	status->exit_code   = WIFEXITED( wstatus ) ? WEXITSTATUS( wstatus ) : -1;
	status->term_signal = WIFSIGNALED( wstatus ) ? WTERMSIG( wstatus ) : 0;
	return SENTINEL_LAUNCH_EXITED;
}

static sentinel_launcher g_sentinel_spawn_launcher = { sentinel_spawn_launch };

sentinel_launcher* sentinel_default_launcher()
{
	return &g_sentinel_spawn_launcher;
}
