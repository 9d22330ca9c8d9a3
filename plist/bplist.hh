#pragma once



#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>



namespace dsstore::plist
{

struct Node;

typedef std::vector<Node> Array;
typedef std::vector<std::pair<std::string, Node>> Dictionary;
typedef std::vector<uint8_t> Data;

struct Date
{
	// seconds since 2001-01-01
	double seconds;

	bool operator==(const Date &) const = default;
};

struct Uid
{
	uint64_t value;

	bool operator==(const Uid &) const = default;
};

struct Set
{
	Array items;

	bool operator==(const Set &other) const;
};


struct Node
{
	std::variant<std::monostate, bool, int64_t, double, Date, Data, std::string, Uid, Array, Set, Dictionary> value;

	Node();
	Node(bool v);
	Node(int64_t v);
	Node(int v);
	Node(double v);
	Node(Date v);
	Node(Data v);
	Node(std::string v);
	Node(const char *v);
	Node(Uid v);
	Node(Array v);
	Node(Set v);
	Node(Dictionary v);

	template<typename T>
	const T *get() const
	{
		return std::get_if<T>(&value);
	}

	template<typename T>
	T *get()
	{
		return std::get_if<T>(&value);
	}

	bool operator==(const Node &other) const;
};


Node parse(const uint8_t *data, uint32_t size);
Node parse(const std::vector<uint8_t> &data);
std::vector<uint8_t> serialize(const Node &root);

const Node *find(const Dictionary &dictionary, const std::string &key);
void set(Dictionary &dictionary, const std::string &key, Node value);
bool erase(Dictionary &dictionary, const std::string &key);

// lenient scalar views, numbers convert between integer and real
std::optional<double> to_number(const Node *node);
std::optional<bool> to_bool(const Node *node);
std::optional<std::string> to_string(const Node *node);

std::string describe(const Node &node, uint32_t indent = 0);

}
