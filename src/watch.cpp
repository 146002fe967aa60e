#if defined( __linux__ )
#   include "watch_linux.cpp"
#else
#   error "Unsupported platform"
#endif
