// C++11 - use multiple source files.

#include "lest.hpp"


lest::tests & specification() {
	static lest::tests tests;
	return tests;
}

int main(int argc, char * argv[]) {
	return lest::run(specification(), argc, argv);
}
