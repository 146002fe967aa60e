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

#include "greatest.h"
#include <sentinel/watch.h>

#include <string.h>
#include <stdlib.h> // system
#include <errno.h>
#include <stdio.h>

static const char* get_test_dir()
{
	static char temp_path[4096] = {0};
	static bool fetched = false;
	if( !fetched )
	{
		strcat( temp_path, P_tmpdir );
		strcat( temp_path, "/sentinel_watch_test/" );
		printf( "Running tests in \"%s\"\n", temp_path );
		fetched = true;
	}
	return temp_path;
}

static void run_system( const char* cmd, const char* path )
{
	char buffer[4096] = {0};
	strcat( buffer, cmd );
	strcat( buffer, path );
	if( system( buffer ) < 0 )
		printf("failed to run system( %s )\n", buffer );
}

static void create_dir ( const char* dirname  ) { run_system( "mkdir -p ", dirname ); }
static void create_file( const char* filename ) { run_system( "touch ", filename ); }
static void remove_dir ( const char* dirname  ) { run_system( "rm -rf ", dirname ); }
static void remove_file( const char* filename ) { run_system( "rm ", filename ); }
static void append_file( const char* filename ) { run_system( "echo data >> ", filename ); }
static void chmod_file ( const char* filename ) { run_system( "chmod 600 ", filename ); }
static void move_file( const char* src, const char* dst )
{
	char buffer[4096] = {0};
	strcat( buffer, "mv " );
	strcat( buffer, src );
	strcat( buffer, " " );
	strcat( buffer, dst );
	if( system( buffer ) < 0 )
		printf("failed to run system( %s )\n", buffer );
}

static const char* test_dir_path( const char* path, char* buffer )
{
	buffer[0] = '\0';
	strcat( buffer, get_test_dir() );
	strcat( buffer, path );
	return buffer;
}

static const char* test_dir_path( const char* path )
{
	static char buffer[4096];
	return test_dir_path( path, buffer );
}

static void setup_test_dir()
{
	// ... remove dir from prev test ...
	remove_dir( get_test_dir() );

	// ... and recreate it ...
	create_dir( get_test_dir() );
}

#define TEST_MAX_EVENTS 8

struct test_handler
{
	sentinel_watch_handler handler;
	size_t wanted; ///< stop polling after this many events.

	size_t events_cnt;
	unsigned int ops[TEST_MAX_EVENTS];
	char paths[TEST_MAX_EVENTS][4096];
	size_t errors_cnt;
};

static bool watch_event_handler( sentinel_watch_handler* handler, const char* path, unsigned int ops )
{
	test_handler* h = (test_handler*)handler;
	if( h->events_cnt < TEST_MAX_EVENTS )
	{
		h->ops[h->events_cnt] = ops;
		snprintf( h->paths[h->events_cnt], sizeof( h->paths[0] ), "%s", path );
	}
	++h->events_cnt;
	return h->events_cnt < h->wanted;
}

static bool watch_error_handler( sentinel_watch_handler* handler, const char* )
{
	test_handler* h = (test_handler*)handler;
	++h->errors_cnt;
	return false;
}

static void handler_reset( test_handler* h, size_t wanted )
{
	memset( h, 0x0, sizeof( test_handler ) );
	h->handler.event = watch_event_handler;
	h->handler.error = watch_error_handler;
	h->wanted = wanted;
}

static enum greatest_test_res check_event( test_handler* h, size_t index, unsigned int ops, const char* path )
{
	ASSERT( index < h->events_cnt );
	ASSERT_EQ( ops, h->ops[index] );
	ASSERT_STR_EQ( path, h->paths[index] );
	PASS();
}

static sentinel_watch_t create_watch( const char* path )
{
	sentinel_watch_t watcher = sentinel_watch_create( SENTINEL_WATCH_DEFAULT, 0x0 );
	if( watcher && sentinel_watch_add( watcher, path ) != 0 )
	{
		sentinel_watch_destroy( watcher );
		return 0x0;
	}
	return watcher;
}

TEST create_remove_file()
{
	setup_test_dir();

	sentinel_watch_t watcher = create_watch( get_test_dir() );
	ASSERT( 0x0 != watcher );
	test_handler handler;

	char path[4096];
	test_dir_path( "f1", path );

	handler_reset( &handler, 1 );
	create_file( path );
	sentinel_watch_poll( watcher, &handler.handler );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_CREATE, path ) );

	// ... skip the attribute change touch makes after creating ...
	handler_reset( &handler, TEST_MAX_EVENTS + 1 );
	sentinel_watch_poll( watcher, &handler.handler );

	handler_reset( &handler, 1 );
	remove_file( path );
	sentinel_watch_poll( watcher, &handler.handler );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_REMOVE, path ) );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST write_to_file()
{
	setup_test_dir();
	char path[4096];
	test_dir_path( "f1", path );
	create_file( path );

	sentinel_watch_t watcher = create_watch( get_test_dir() );
	ASSERT( 0x0 != watcher );
	test_handler handler;

	handler_reset( &handler, 1 );
	append_file( path );
	sentinel_watch_poll( watcher, &handler.handler );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_WRITE, path ) );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST chmod_changes_attributes()
{
	setup_test_dir();
	char path[4096];
	test_dir_path( "f1", path );
	create_file( path );

	sentinel_watch_t watcher = create_watch( get_test_dir() );
	ASSERT( 0x0 != watcher );
	test_handler handler;

	handler_reset( &handler, 1 );
	chmod_file( path );
	sentinel_watch_poll( watcher, &handler.handler );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_CHMOD, path ) );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST test_move_file()
{
	setup_test_dir();
	char path1[2048];
	char path2[2048];
	test_dir_path( "f1", path1 );
	test_dir_path( "f2", path2 );

	create_file( path1 );

	sentinel_watch_t watcher = create_watch( get_test_dir() );
	ASSERT( 0x0 != watcher );
	test_handler handler;
	handler_reset( &handler, 2 );

	move_file( path1, path2 );
	sentinel_watch_poll( watcher, &handler.handler );

	// ... a move is reported as a rename of the old name followed by a create of the new one ...
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_RENAME, path1 ) );
	CHECK_CALL( check_event( &handler, 1, SENTINEL_OP_CREATE, path2 ) );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST watch_single_file()
{
	setup_test_dir();
	char path[4096];
	test_dir_path( "watched.file", path );
	create_file( path );

	sentinel_watch_t watcher = create_watch( path );
	ASSERT( 0x0 != watcher );
	test_handler handler;

	// ... events on the watched file itself carry the watched path ...
	handler_reset( &handler, 1 );
	append_file( path );
	sentinel_watch_poll( watcher, &handler.handler );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_WRITE, path ) );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST path_without_trailing_slash()
{
	setup_test_dir();
	char dir[4096];
	test_dir_path( "sub", dir );
	create_dir( dir );

	sentinel_watch_t watcher = create_watch( dir );
	ASSERT( 0x0 != watcher );
	test_handler handler;

	char path[4096];
	test_dir_path( "sub/f1", path );

	handler_reset( &handler, 1 );
	create_file( path );
	sentinel_watch_poll( watcher, &handler.handler );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_CREATE, path ) );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST not_recursive()
{
	setup_test_dir();
	create_dir( test_dir_path( "subdir" ) );

	sentinel_watch_t watcher = create_watch( get_test_dir() );
	ASSERT( 0x0 != watcher );
	test_handler handler;
	handler_reset( &handler, TEST_MAX_EVENTS + 1 );

	create_file( test_dir_path( "subdir/f1" ) );
	sentinel_watch_poll( watcher, &handler.handler );

	// ... only the containing dir changing its attributes may show up, never the nested file ...
	for( size_t i = 0; i < handler.events_cnt && i < TEST_MAX_EVENTS; ++i )
		ASSERT( strstr( handler.paths[i], "f1" ) == 0x0 );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST resume_after_stopped_poll()
{
	setup_test_dir();

	sentinel_watch_t watcher = create_watch( get_test_dir() );
	ASSERT( 0x0 != watcher );
	test_handler handler;

	char path1[2048];
	char path2[2048];
	test_dir_path( "d1", path1 );
	test_dir_path( "d2", path2 );

	// ... both creates land in the same read, the second poll must still get the one not handed out ...
	char cmd[4096];
	snprintf( cmd, sizeof( cmd ), "%s %s", path1, path2 );
	run_system( "mkdir ", cmd );

	handler_reset( &handler, 1 );
	sentinel_watch_poll( watcher, &handler.handler );
	ASSERT_EQ( 1u, handler.events_cnt );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_CREATE, path1 ) );

	handler_reset( &handler, 1 );
	sentinel_watch_poll( watcher, &handler.handler );
	ASSERT_EQ( 1u, handler.events_cnt );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_CREATE, path2 ) );

	// ... and nothing after that ...
	handler_reset( &handler, TEST_MAX_EVENTS + 1 );
	sentinel_watch_poll( watcher, &handler.handler );
	ASSERT_EQ( 0u, handler.events_cnt );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST add_missing_path()
{
	setup_test_dir();

	sentinel_watch_t watcher = sentinel_watch_create( SENTINEL_WATCH_DEFAULT, 0x0 );
	ASSERT( 0x0 != watcher );
	ASSERT_EQ( ENOENT, sentinel_watch_add( watcher, test_dir_path( "not_here" ) ) );

	sentinel_watch_destroy( watcher );
	PASS();
}

TEST poll_through_source()
{
	setup_test_dir();

	sentinel_watch_t watcher = sentinel_watch_create( SENTINEL_WATCH_DEFAULT, 0x0 );
	ASSERT( 0x0 != watcher );
	sentinel_source* source = sentinel_watch_source( watcher );
	ASSERT_EQ( 0, source->add( source, get_test_dir() ) );

	char path[4096];
	test_dir_path( "f1", path );

	test_handler handler;
	handler_reset( &handler, 1 );
	create_file( path );
	source->poll( source, &handler.handler );
	CHECK_CALL( check_event( &handler, 0, SENTINEL_OP_CREATE, path ) );
	ASSERT_EQ( 0u, handler.errors_cnt );

	sentinel_watch_destroy( watcher );
	PASS();
}

GREATEST_SUITE( sentinel_watch )
{
	RUN_TEST( create_remove_file );
	RUN_TEST( write_to_file );
	RUN_TEST( chmod_changes_attributes );
	RUN_TEST( test_move_file );
	RUN_TEST( watch_single_file );
	RUN_TEST( path_without_trailing_slash );
	RUN_TEST( not_recursive );
	RUN_TEST( resume_after_stopped_poll );
	RUN_TEST( add_missing_path );
	RUN_TEST( poll_through_source );
}

GREATEST_MAIN_DEFS();

int main( int argc, char **argv )
{
	get_test_dir();

	GREATEST_MAIN_BEGIN();
	RUN_SUITE( sentinel_watch );
	GREATEST_MAIN_END();
}
