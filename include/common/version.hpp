#ifndef INSTSHARE_VERSION_HPP
#define INSTSHARE_VERSION_HPP

// Normally injected by the build from the project version.
#ifndef INSTSHARE_VERSION
#define INSTSHARE_VERSION "1.0.0"
#endif

#endif // INSTSHARE_VERSION_HPP
