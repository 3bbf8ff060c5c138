#ifndef CSVEXPR_COMMON_DEFS_H
#define CSVEXPR_COMMON_DEFS_H

// Record terminator used by the single-record decode path. U+FFFF is a
// Unicode noncharacter, so it never shows up in well-formed text and the
// whole input value is always treated as one record.
#define CSVEXPR_LINE_SEP_SENTINEL "\xEF\xBF\xBF"

#ifdef _MSC_VER

#ifndef likely
#define likely(x) x
#endif
#ifndef unlikely
#define unlikely(x) x
#endif

#else

#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif

#endif // _MSC_VER

#endif // CSVEXPR_COMMON_DEFS_H
