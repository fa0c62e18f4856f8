#include "bookbinder_cli.hpp"

int main(int argc, char **argv) {
	bookbinder::vector<bookbinder::string> args(argv + 1, argv + argc);
	return bookbinder::RunBookbinder(args);
}
