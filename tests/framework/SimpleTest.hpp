#pragma once

#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// a minimal test registry: every TEST_CASE registers itself, 'main' runs them all

namespace mirror::test {

class TestRunner {
public:
	static TestRunner & instance() {
		static TestRunner Instance;
		return Instance;
	}

	void add(std::string Name, std::function<void()> Test) {
		Tests_.push_back({ std::move(Name), std::move(Test) });
	}

	int runAll() {
		int Passed = 0;
		int Failed = 0;

		std::cout << "\n=== " << Suite_ << " ===\n" << std::endl;
		for (const auto & [Name, Test] : Tests_) {
			try {
				Test();
				std::cout << "[PASS] " << Name << std::endl;
				++Passed;
			} catch (const std::exception & Failure) {
				std::cout << "[FAIL] " << Name << " - " << Failure.what() << std::endl;
				++Failed;
			}
		}
		std::cout << "\nResults: " << Passed << " passed, " << Failed << " failed."
		          << std::endl;
		return Failed > 0 ? 1 : 0;
	}

	void name(std::string Suite) { Suite_ = std::move(Suite); }

private:
	struct Entry {
		std::string Name;
		std::function<void()> Test;
	};
	std::vector<Entry> Tests_;
	std::string Suite_ = "mirror-bridge";
};

struct Registrar {
	Registrar(std::string Name, std::function<void()> Test) {
		TestRunner::instance().add(std::move(Name), std::move(Test));
	}
};

class AssertionFailure : public std::runtime_error {
public:
	explicit AssertionFailure(const std::string & Message)
	: std::runtime_error(Message) {}
};

inline std::string where(const char * File, int Line) {
	return std::string(" at ") + File + ":" + std::to_string(Line);
}

} // namespace mirror::test

#define TEST_CASE(name)                                                                  \
	void name();                                                                         \
	static mirror::test::Registrar reg_##name(#name, name);                              \
	void name()

#define ASSERT_TRUE(condition)                                                           \
	if (!(condition))                                                                    \
	throw mirror::test::AssertionFailure("Assertion failed: " #condition +               \
	                                     mirror::test::where(__FILE__, __LINE__))

#define ASSERT_FALSE(condition)                                                          \
	if (condition)                                                                       \
	throw mirror::test::AssertionFailure("Assertion failed: " #condition " is true" +    \
	                                     mirror::test::where(__FILE__, __LINE__))

#define ASSERT_EQ(a, b)                                                                  \
	if ((a) != (b))                                                                      \
	throw mirror::test::AssertionFailure("Assertion failed: " #a " == " #b +             \
	                                     mirror::test::where(__FILE__, __LINE__))

#define ASSERT_NEAR(a, b, epsilon)                                                       \
	if (((a) - (b)) > (epsilon) || ((b) - (a)) > (epsilon))                              \
	throw mirror::test::AssertionFailure("Assertion failed: " #a " near " #b +           \
	                                     mirror::test::where(__FILE__, __LINE__))
