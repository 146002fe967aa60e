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

#include <pthread.h>
#include <string.h>

/**
 * Single-slot completion value, the first status signaled is the one sentinel_done_wait() returns.
 */
struct sentinel_done
{
	pthread_mutex_t mtx;
	pthread_cond_t  cond;
	bool            signaled;
	int             status;
};

static void sentinel_done_init( sentinel_done* done )
{
	pthread_mutex_init( &done->mtx, 0x0 );
	pthread_cond_init( &done->cond, 0x0 );
	done->signaled = false;
	done->status   = 0;
}

static void sentinel_done_destroy( sentinel_done* done )
{
	pthread_cond_destroy( &done->cond );
	pthread_mutex_destroy( &done->mtx );
}

static void sentinel_done_signal( sentinel_done* done, int status )
{
	pthread_mutex_lock( &done->mtx );
	if( !done->signaled )
	{
		done->signaled = true;
		done->status   = status;
		pthread_cond_signal( &done->cond );
	}
	pthread_mutex_unlock( &done->mtx );
}

static int sentinel_done_wait( sentinel_done* done )
{
	pthread_mutex_lock( &done->mtx );
	while( !done->signaled )
		pthread_cond_wait( &done->cond, &done->mtx );
	int status = done->status;
	pthread_mutex_unlock( &done->mtx );
	return status;
}

struct sentinel_run_state
{
	sentinel_watch_handler handler; // needs to be first, callbacks cast back from it.

	const sentinel_config* config;
	sentinel_source*       source;
	sentinel_launcher*     launcher;
	sentinel_done          done;
};

static bool sentinel_run_on_event( sentinel_watch_handler* handler, const char* path, unsigned int ops )
{
	sentinel_run_state* state = (sentinel_run_state*)handler;

	switch( sentinel_dispatch( state->config, state->launcher, path, ops ) )
	{
		case SENTINEL_DISPATCH_NONE:
			return true;
		case SENTINEL_DISPATCH_DONE:
			if( state->config->loop )
				return true;
			sentinel_done_signal( &state->done, 0 );
			return false;
		case SENTINEL_DISPATCH_STOP:
			sentinel_done_signal( &state->done, 0 );
			return false;
		case SENTINEL_DISPATCH_FATAL:
			sentinel_done_signal( &state->done, 1 );
			return false;
	}
	return false;
}

static bool sentinel_run_on_error( sentinel_watch_handler* handler, const char* message )
{
	sentinel_run_state* state = (sentinel_run_state*)handler;

	// ... an error without a message still ends the watch, but quietly and successfully ...
	bool has_message = message != 0x0 && message[0] != '\0';
	if( has_message )
		sentinel_log_error( "Error: %s", message );

	sentinel_done_signal( &state->done, has_message ? 1 : 0 );
	return false;
}

static void* sentinel_run_thread( void* arg )
{
	sentinel_run_state* state = (sentinel_run_state*)arg;
	state->source->poll( state->source, &state->handler );

	pthread_mutex_lock( &state->done.mtx );
	bool signaled = state->done.signaled;
	pthread_mutex_unlock( &state->done.mtx );
	if( !signaled )
	{
		sentinel_log_error( "Error: watch source stopped unexpectedly" );
		sentinel_done_signal( &state->done, 1 );
	}
	return 0x0;
}

int sentinel_run( const sentinel_config* config, sentinel_source* source, sentinel_launcher* launcher )
{
	for( size_t i = 0; i < config->paths_cnt; ++i )
	{
		const char* path = config->paths[i];
		sentinel_log_verbose( "* %s\n", path );

		int err = source->add( source, path );
		if( err != 0 )
		{
			sentinel_log_error( "Error: couldn't watch %s: %s", path, strerror( err ) );
			return 1;
		}
	}

	sentinel_run_state state;
	state.handler.event = sentinel_run_on_event;
	state.handler.error = sentinel_run_on_error;
	state.config   = config;
	state.source   = source;
	state.launcher = launcher ? launcher : sentinel_default_launcher();
	sentinel_done_init( &state.done );

	pthread_t thread;
	int err = pthread_create( &thread, 0x0, sentinel_run_thread, &state );
	if( err != 0 )
	{
		sentinel_log_error( "Error: couldn't start watch thread: %s", strerror( err ) );
		sentinel_done_destroy( &state.done );
		return 1;
	}

	int status = sentinel_done_wait( &state.done );

	// ... the thread stops reading as soon as it signals, so this only waits for it to unwind ...
	pthread_join( thread, 0x0 );
	sentinel_done_destroy( &state.done );
	return status;
}
