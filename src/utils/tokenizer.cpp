#include <cstring>

#include "tokenizer.hpp"


using namespace std;


bool is_token_space(char c) {
	return c == ' ' or c == '\t' or c == '\n';
}

bool is_token_punct(char c) {
	return c != '\0' and strchr(".,;:!?()[]{}", c) != nullptr;
}


vector<string> tokenize(const string & text) {
	vector<string> tokens;
	string current;

	for (char c : text) {
		if (is_token_space(c)) {
			if (not current.empty()) {
				tokens.push_back(current);
				current.clear();
			}
		} else if (is_token_punct(c)) {
			if (not current.empty()) {
				tokens.push_back(current);
				current.clear();
			}
			tokens.push_back(string(1, c));
		} else {
			current += c;
		}
	}

	if (not current.empty())
		tokens.push_back(current);

	return tokens;
}


string join_tokens(const vector<string> & tokens, size_t start, size_t end) {
	string joined;
	for (size_t idx=start ; idx<end ; idx++) {
		if (idx != start)
			joined += ' ';
		joined += tokens[idx];
	}
	return joined;
}
