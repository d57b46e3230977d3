#include <string>
#include <cstddef>


#ifndef UTF8_H
#define UTF8_H

/** True for the 10xxxxxx bytes that continue a multi-byte UTF-8 sequence. **/
inline bool is_utf8_continuation(unsigned char byte) {
	return (byte & 0xC0) == 0x80;
}

/** Move pos back until it is on the first byte of a code point (or reaches floor).
 * Text that is not valid UTF-8 is only rewound over continuation bytes, so at most 3 steps
 * are taken for any well formed sequence.
 * @param text Text indexed by bytes.
 * @param pos Byte position to align. pos == text.size() is already aligned.
 * @param floor Lowest position that may be returned.
 * @return The aligned position, in [floor, pos].
 **/
inline size_t utf8_floor(const std::string & text, size_t pos, size_t floor) {
	while (pos > floor and pos < text.size() and is_utf8_continuation(text[pos]))
		pos -= 1;
	return pos;
}

/** Move pos forward past the continuation bytes of the character it is in. **/
inline size_t utf8_ceil(const std::string & text, size_t pos) {
	while (pos < text.size() and is_utf8_continuation(text[pos]))
		pos += 1;
	return pos;
}

#endif
