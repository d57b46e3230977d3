#include <string>
#include <vector>


#ifndef TOKENIZER_H
#define TOKENIZER_H

/** Split a text into approximate tokens.
 * Space, tab and newline separate tokens and are dropped. Each of . , ; : ! ? ( ) [ ] { }
 * ends the current token and is a token by itself. Any other byte belongs to the current token.
 * As every separator is ASCII, multi-byte UTF-8 characters always stay inside one token.
 * @param text Text to split.
 * @return The tokens in reading order.
 **/
std::vector<std::string> tokenize(const std::string & text);

/** Concatenate tokens[start, end) with one space between consecutive tokens. **/
std::string join_tokens(const std::vector<std::string> & tokens, size_t start, size_t end);

bool is_token_space(char c);
bool is_token_punct(char c);

#endif
