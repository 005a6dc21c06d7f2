#include <iostream>
#include <fstream>
#include <chrono>
#include <sstream>
#include "tristore_graph.h"
#include "tristore_ntriples.h"
#include "tristore_command.h"


using namespace tristore;


/*
* This class contains the graph, but also acts as a visitor
* to the std::variant returned by `parse_command`, leading to
* an elegant loop in the `main` function below.
*/
class ShellApplication
{
public:
	ShellApplication(bool log_plan_types) :
		m_done(false),
		m_log_plan_types(log_plan_types),
		m_graph(std::cerr)
	{ }

	void operator()(const EmptyCommand&) {}

	void operator()(const BadCommand& e)
	{
		std::cerr << "Bad command. Error: " << e.error << std::endl;
	}

	void operator()(const QuitCommand&)
	{
		std::cout << "Exiting..." << std::endl;
		m_done = true;
	}

	void operator()(const SizeCommand&)
	{
		std::cout << m_graph.size() << " triples." << std::endl;
	}

	void operator()(const LoadCommand& c)
	{
		const auto start_time = std::chrono::system_clock::now();

		std::ifstream file(c.filename, std::ios::binary);

		if (!file)
		{
			std::cerr << "Unfortunately the given file '"
				<< c.filename << "' cannot be opened." << std::endl;
			return;
		}

		auto file_iter = create_ntriples_file_parser(file, std::cerr);

		size_t read_count = 0, add_count = 0;
		file_iter->start();
		while (file_iter->valid())
		{
			if (m_graph.add(file_iter->current()))
				++add_count;
			file_iter->next();
			++read_count;
		}

		const auto end_time = std::chrono::system_clock::now();

		std::cout << "Loaded " << add_count << " new triples (of " << read_count
			<< " read) in " <<
			std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count()
			<< "ms." << std::endl;
	}

	void operator()(const AssertCommand& c)
	{
		const auto start_time = std::chrono::system_clock::now();
		const size_t size_before = m_graph.size();

		m_graph.assert_turtles(c.turtles);

		const auto end_time = std::chrono::system_clock::now();

		std::cout << "Asserted " << (m_graph.size() - size_before) << " new triples in " <<
			std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count()
			<< "ms." << std::endl;
	}

	void operator()(const RetractCommand& c)
	{
		const auto start_time = std::chrono::system_clock::now();
		const size_t size_before = m_graph.size();

		m_graph.retract_turtles(c.turtles);

		const auto end_time = std::chrono::system_clock::now();

		std::cout << "Retracted " << (size_before - m_graph.size()) << " triples in " <<
			std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count()
			<< "ms." << std::endl;
	}

	void operator()(const HasCommand& c)
	{
		std::cout << (m_graph.has(c.triple.sub, c.triple.pred, c.triple.obj) ? "true" : "false")
			<< std::endl;
	}

	void operator()(const SelectCommand& c)
	{
		log_plan(c.pattern);
		print_all(*m_graph.evaluate(c.pattern));
	}

	void operator()(const TurtleCommand& c)
	{
		log_plan(c.pattern);
		print_all(*m_graph.turtle(c.pattern.sub, c.pattern.pred, c.pattern.obj));
	}

	bool done() const
	{
		return m_done;
	}

private:
	void log_plan(const TriplePattern& pattern) const
	{
		if (m_log_plan_types)
		{
			std::cout << "\t--> pattern type " << trip_pat_type_str(pattern_type(pattern))
				<< " evaluated over the " << rotation_str(Graph::plan_pattern(pattern))
				<< " index" << std::endl;
		}
	}

	template<typename T>
	void print_all(IIterator<T>& iter) const
	{
		const auto start_time = std::chrono::system_clock::now();

		std::cout << "----------" << std::endl;

		size_t count = 0;
		iter.start();
		while (iter.valid())
		{
			std::cout << TristoreToStringVisitor()(iter.current()) << std::endl;
			iter.next();
			++count;
		}

		std::cout << "----------" << std::endl;

		const auto end_time = std::chrono::system_clock::now();

		std::cout << count << " results obtained in " <<
			std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count()
			<< "ms." << std::endl;
	}

private:
	bool m_done;
	const bool m_log_plan_types;
	Graph m_graph;
};


void show_help()
{
	std::cout << "-h : Print help. If using this option, no other options can be used." << std::endl;
	std::cout << "-L : Show the pattern type and index chosen for each SELECT/TURTLE. "
		"If used, it must appear before any -i or -f options." << std::endl;
	std::cout << "-i commands : Execute command(s)." << std::endl;
	std::cout << "-f filename : Execute command(s) from file." << std::endl;
	std::cout << "Using either -i or -f will open the application in non-interactive "
		"mode, and the application will exit automatically after running all "
		"given commands. Not using -i or -f will open the application in interactive "
		"mode, where you can type what you want, and have to manually close with `QUIT`." << std::endl;
	std::cout << "Commands: ASSERT { <s> <p> <o> . <p2> <o2> . <o3> }, RETRACT { <s> ?p ?o }, "
		"SELECT <s> ?p ?o, TURTLE ?s ?p ?o, HAS <s> <p> <o>, SIZE, LOAD filename, QUIT." << std::endl;
}


int main(int argc, char* argv[])
{
	if (argc == 2 && std::string(argv[1]) == "-h")
	{
		show_help();
		return 0;
	}

	const bool log_plan_types = (argc > 1 && std::string(argv[1]) == "-L");
	const int cmd_start_idx = log_plan_types ? 2 : 1;

	if ((argc - cmd_start_idx) % 2 != 0)
	{
		std::cerr << "Every -i or -f option needs an argument. Showing help." << std::endl;
		show_help();
		return 1;
	}

	const int num_commands = (argc - cmd_start_idx) / 2;

	ShellApplication app(log_plan_types);

	if (num_commands > 0)  // noninteractive mode
	{
		for (int i = 0; i < num_commands && !app.done(); ++i)
		{
			std::string cmd = argv[2 * i + cmd_start_idx];
			std::string arg = argv[2 * i + cmd_start_idx + 1];
			if (cmd == "-i")
			{
				std::stringstream cmd_in(arg);
				while (!app.done() && cmd_in)
				{
					std::visit(app, parse_command(cmd_in));
				}
			}
			else if (cmd == "-f")
			{
				std::ifstream cmd_in(arg, std::ios::binary);
				if (!cmd_in)
				{
					std::cerr << "Cannot open file '" << arg << "'." << std::endl;
					return 1;
				}
				while (!app.done() && cmd_in)
				{
					std::visit(app, parse_command(cmd_in));
				}
			}
			else
			{
				std::cerr << "Bad command '" << cmd
					<< "', must either be '-i' or '-f'. Showing help."
					<< std::endl;
				show_help();
				return 1;
			}
		}
	}
	else  // interactive mode
	{
		while (!app.done() && std::cin)
		{
			std::visit(app, parse_command(std::cin));
		}
	}

	return 0;
}
