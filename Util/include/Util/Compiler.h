
#ifndef COMPILER_H_
#define COMPILER_H_

#if defined(__GNUC__)
#define COLD_CODE __attribute__((noinline, cold))
#else
#define COLD_CODE
#endif

#endif
