#include <gtest/gtest.h>

#include "mm/repair/sanitizer.hpp"

#include <string>
#include <thread>
#include <vector>

using mm::repair::RepairRecord;
using mm::repair::RepairRule;
using mm::repair::sanitize;
using mm::repair::SanitizeResult;
using mm::repair::SanitizerOptions;
using mm::repair::SanitizeStatus;

namespace
{

void expectFixed(const std::string &input, const std::string &expected)
{
    SanitizeResult result = sanitize(input);
    EXPECT_EQ(result.status, SanitizeStatus::Fixed) << input;
    EXPECT_EQ(result.text, expected) << input;
    EXPECT_FALSE(result.repairs.empty()) << input;
}

void expectUnchanged(const std::string &input)
{
    SanitizeResult result = sanitize(input);
    EXPECT_EQ(result.status, SanitizeStatus::Unchanged) << input;
    EXPECT_EQ(result.text, input);
    EXPECT_TRUE(result.repairs.empty()) << input;
}

const std::vector<std::string> &brokenCorpus()
{
    static const std::vector<std::string> corpus{
        "flowchart TD\n    A[File.open] --> B[Done]",
        "flowchart TD\n    D -->|{:fib, n, client}| E",
        "flowchart TD\n    B -->|\"\"| D[\"IO.puts\"]",
        "flowchart TD\n    A --> D[\"inner function\"].",
        "flowchart TD\n    B -->|\"[\\\"a\\\"]\"| F[\"Result\"]",
        "flowchart TD\n    B -->|\"{self, \"World!\"}\"| C[\"receive\"]",
        "flowchart TD\n    C -->|\"{:ok, \"message\"}\"| D[\"puts\"]",
        "flowchart TD\n    A[a.b] --> B[c].\n",
        "flowchart TD\r\n    A[key: value] -->|a & b| B[x]\r\n",
        "flowchart TD\n    A[File.open] -->|{:ok, file}| B[process(file)]\n"
        "    A -->|{:error, msg}| C[IO.puts]\n    B -->|\"\"| D[Done]\n",
        "graph LR\n    A[\"say \\\"hi\\\" \"now\"\"] -->|\"\"| B{ok?}.\n",
    };
    return corpus;
}

} // namespace

TEST(Sanitizer, QuotesNodeLabelWithDot)
{
    SanitizeResult result = sanitize("flowchart TD\n    A[File.open] --> B[Done]");
    EXPECT_EQ(result.status, SanitizeStatus::Fixed);
    EXPECT_EQ(result.text, "flowchart TD\n    A[\"File.open\"] --> B[Done]");
    ASSERT_EQ(result.repairs.size(), 1u);
    EXPECT_EQ(result.repairs[0], (RepairRecord{RepairRule::SpecialCharQuoter, 2}));
}

TEST(Sanitizer, QuotesEdgeLabelWithBraces)
{
    expectFixed("flowchart TD\n    D -->|{:fib, n, client}| E", "flowchart TD\n    D -->|\"{:fib, n, client}\"| E");
}

TEST(Sanitizer, RemovesEmptyEdgeLabel)
{
    SanitizeResult result = sanitize("flowchart TD\n    B -->|\"\"| D[\"IO.puts\"]");
    EXPECT_EQ(result.text, "flowchart TD\n    B --> D[\"IO.puts\"]");
    ASSERT_EQ(result.repairs.size(), 1u);
    EXPECT_EQ(result.repairs[0], (RepairRecord{RepairRule::EmptyEdgeLabel, 2}));

    expectFixed("flowchart TD\n    B ---|\"\"| D[Done]", "flowchart TD\n    B --- D[Done]");
}

TEST(Sanitizer, LeavesSequenceDiagramsAlone)
{
    expectUnchanged("sequenceDiagram\n    participant C as Client\n    C->>+G: call(:get_state)");
    expectUnchanged("sequenceDiagram\n    participant C as Client\n    participant G as GenServer\n"
                    "    C->>+G: call(:get_state)\n    G-->>-C: {:ok, state}\n");
    expectUnchanged("classDiagram\n    class Animal\n    Animal : +eat(food.x)\n");
}

TEST(Sanitizer, StripsTrailingPeriod)
{
    expectFixed("flowchart TD\n    A --> D[\"inner function\"].", "flowchart TD\n    A --> D[\"inner function\"]");
    expectFixed("flowchart TD\n    A --> D[\"text\"].\n    D --> E", "flowchart TD\n    A --> D[\"text\"]\n    D --> E");
}

TEST(Sanitizer, NormalizesEscapedQuotes)
{
    expectFixed("flowchart TD\n    B -->|\"[\\\"a\\\"]\"| F[\"Result\"]",
                "flowchart TD\n    B -->|\"['a']\"| F[\"Result\"]");
    expectFixed("flowchart TD\n    B -->|\"[[\\\"a\\\"], [\\\"e\\\"]]\"| F",
                "flowchart TD\n    B -->|\"[['a'], ['e']]\"| F");
}

TEST(Sanitizer, ResolvesNestedQuotes)
{
    expectFixed("flowchart TD\n    B -->|\"{self, \"World!\"}\"| C[\"receive\"]",
                "flowchart TD\n    B -->|\"{self, World!}\"| C[\"receive\"]");
    expectFixed("flowchart TD\n    C -->|\"{:ok, \"message\"}\"| D[\"puts\"]",
                "flowchart TD\n    C -->|\"{:ok, message}\"| D[\"puts\"]");
}

TEST(Sanitizer, RequiresAFlowchartHeader)
{
    expectUnchanged("B -->|\"[[\\\"a\\\"], [\\\"e\\\"]]\"| F");
    expectUnchanged("B -->|\"{self, \"World!\"}\"| C[\"receive\"]");
}

TEST(Sanitizer, QuotesUnquotedSpecialCharacters)
{
    expectFixed("flowchart TD\n    A[process(file)] --> B", "flowchart TD\n    A[\"process(file)\"] --> B");
    expectFixed("flowchart TD\n    A[File.open!] --> B", "flowchart TD\n    A[\"File.open!\"] --> B");
    expectFixed("flowchart TD\n    A[key: value] --> B", "flowchart TD\n    A[\"key: value\"] --> B");
    expectFixed("flowchart TD\n    B[&(&1 + 1)]", "flowchart TD\n    B[\"&(&1 + 1)\"]");
    expectFixed("flowchart TD\n    A[a || b]", "flowchart TD\n    A[\"a || b\"]");
    expectFixed("flowchart TD\n    A -->|key: value| B", "flowchart TD\n    A -->|\"key: value\"| B");
    expectFixed("flowchart TD\n    A -->|a & b| B", "flowchart TD\n    A -->|\"a & b\"| B");
}

TEST(Sanitizer, RepairsSeveralDefectsInOneDiagram)
{
    const std::string input = "flowchart TD\n"
                              "    A[File.open] -->|{:ok, file}| B[process(file)]\n"
                              "    A -->|{:error, msg}| C[IO.puts]\n"
                              "    B -->|\"\"| D[Done]\n";
    const std::string expected = "flowchart TD\n"
                                 "    A[\"File.open\"] -->|\"{:ok, file}\"| B[\"process(file)\"]\n"
                                 "    A -->|\"{:error, msg}\"| C[\"IO.puts\"]\n"
                                 "    B --> D[Done]\n";

    SanitizeResult result = sanitize(input);
    EXPECT_EQ(result.status, SanitizeStatus::Fixed);
    EXPECT_EQ(result.text, expected);
    EXPECT_EQ(result.repairs, (std::vector<RepairRecord>{{RepairRule::SpecialCharQuoter, 2},
                                                         {RepairRule::SpecialCharQuoter, 3},
                                                         {RepairRule::EmptyEdgeLabel, 4}}));
}

TEST(Sanitizer, HandlesElixirCodeInLabels)
{
    expectFixed("flowchart TD\n    A[Enum.map] -->|\"[1, 3, 5, 7]\"| B[&(&1 + 1)]\n    B --> C[Stream]\n",
                "flowchart TD\n    A[\"Enum.map\"] -->|\"[1, 3, 5, 7]\"| B[\"&(&1 + 1)\"]\n    B --> C[Stream]\n");
}

TEST(Sanitizer, FixesTracerModuleDiagram)
{
    const std::string input = "flowchart TD\n"
                              "    A[\"Test\"] -->|\"calls\"| B[\"puts_sum_three/3\"]\n"
                              "    A -->|\"calls\"| C[\"add_list/1\"]\n"
                              "    B -->|\"\"| D[\"IO.puts\"]\n"
                              "    C -->|\"\"| E[\"Enum.reduce\"]\n"
                              "    D -->|\"logs trace\"| F[\"Tracer.dump_defn\"]\n"
                              "    E -->|\"logs result\"| F\n";
    const std::string expected = "flowchart TD\n"
                                 "    A[\"Test\"] -->|\"calls\"| B[\"puts_sum_three/3\"]\n"
                                 "    A -->|\"calls\"| C[\"add_list/1\"]\n"
                                 "    B --> D[\"IO.puts\"]\n"
                                 "    C --> E[\"Enum.reduce\"]\n"
                                 "    D -->|\"logs trace\"| F[\"Tracer.dump_defn\"]\n"
                                 "    E -->|\"logs result\"| F\n";

    SanitizeResult result = sanitize(input);
    EXPECT_EQ(result.text, expected);
    EXPECT_EQ(result.repairs,
              (std::vector<RepairRecord>{{RepairRule::EmptyEdgeLabel, 4}, {RepairRule::EmptyEdgeLabel, 5}}));
}

TEST(Sanitizer, ReportsEveryPassThatFiredOnALine)
{
    SanitizeResult result = sanitize("graph LR\n    A[\"say \\\"hi\\\" \"now\"\"] -->|\"\"| B{ok?}.\n");
    EXPECT_EQ(result.text, "graph LR\n    A[\"say 'hi' now\"] --> B{ok?}\n");
    EXPECT_EQ(result.repairs, (std::vector<RepairRecord>{{RepairRule::EscapeNormalizer, 2},
                                                         {RepairRule::NestedQuoteResolver, 2},
                                                         {RepairRule::EmptyEdgeLabel, 2},
                                                         {RepairRule::TrailingPunctuation, 2}}));
}

TEST(Sanitizer, LeavesValidDiagramsUnchanged)
{
    expectUnchanged("flowchart TD\n    A[\"File.open\"] --> B[\"process(file)\"]");
    expectUnchanged("flowchart TD\n    A[Start] --> B[End]");
    expectUnchanged("flowchart TD\n    A -->|\"{:ok, pid}\"| B");
    expectUnchanged("flowchart TD\n    B -->|\"calls\"| D[\"IO.puts\"]");
    expectUnchanged("flowchart LR\n    subgraph Online\n    A[API] --> O[\"Redis\"]\n    end\n");
    expectUnchanged("flowchart TD\n    A[Line 1<br/>Line 2] --> B");
    expectUnchanged("flowchart TD\n    A[Start] --> B[End]\n    style A fill:#48bb78\n");
    expectUnchanged("flowchart TD;\n    A[Start] --> B[End]");
    expectUnchanged("flowchart TD\n    A[Rectangle]\n    B(Round)\n    C{Diamond}\n    D((Circle))\n    E[[Subroutine]]\n");
}

TEST(Sanitizer, RepairsStatementsOnTheHeaderLine)
{
    expectFixed("graph TD; A[File.open] --> B[Done]", "graph TD; A[\"File.open\"] --> B[Done]");
    expectFixed("flowchart LR; A --> B[x.y].\n    B --> C\n", "flowchart LR; A --> B[\"x.y\"]\n    B --> C\n");
}

TEST(Sanitizer, DropsPeriodAfterAnyNodeShape)
{
    expectFixed("flowchart TD\n    A --> B[(Store)].", "flowchart TD\n    A --> B[(Store)]");
    expectFixed("flowchart TD\n    A --> B{{Hex}}.", "flowchart TD\n    A --> B{{Hex}}");
    expectFixed("flowchart TD\n    A --> B([Stop]).", "flowchart TD\n    A --> B([Stop])");
}

TEST(Sanitizer, QuotedLabelsEndingInBackslashOrSpaceStayValid)
{
    expectUnchanged("flowchart TD\n    A[\"C:\\\"] --> B[\"c.d\"]");
    expectUnchanged("flowchart TD\n    A[\"x\" ] --> B[\"y\"]");
}

TEST(Sanitizer, HandlesDegenerateInput)
{
    expectUnchanged("");
    expectUnchanged("   \n   \n   ");
    expectUnchanged("flowchart TD");
    expectUnchanged("flowchart TD\n    A[a [b [c]]] --> B[x.y]\n");
    expectUnchanged("flowchart TD\n    A[Start --> B[x.y\n");
}

TEST(Sanitizer, PreservesLineEndingsAndStructuralLines)
{
    expectFixed("flowchart TD\r\n    A[File.open] --> B\r\n    B --> C[Done].\r\n",
                "flowchart TD\r\n    A[\"File.open\"] --> B\r\n    B --> C[Done]\r\n");
    expectFixed("---\ntitle: Fix: it.\n---\nflowchart LR\n    subgraph API.v1\n    A[x.y]\n    end\n"
                "    classDef hot fill:#f96,color:#fff\n",
                "---\ntitle: Fix: it.\n---\nflowchart LR\n    subgraph API.v1\n    A[\"x.y\"]\n    end\n"
                "    classDef hot fill:#f96,color:#fff\n");
    expectFixed("%%{init: {\"theme\": \"dark\"}}%%\nflowchart TD\n    A[Gr\xC3\xB6\xC3\x9F" "e.x] --> B %% note: a.b\n",
                "%%{init: {\"theme\": \"dark\"}}%%\nflowchart TD\n    A[\"Gr\xC3\xB6\xC3\x9F" "e.x\"] --> B %% note: a.b\n");
}

TEST(Sanitizer, DisabledOptionsReturnInputUnchanged)
{
    SanitizerOptions options;
    options.enabled = false;
    const std::string input = "flowchart TD\n    A[File.open] --> B[Done]";
    SanitizeResult result = sanitize(input, options);
    EXPECT_EQ(result.status, SanitizeStatus::Unchanged);
    EXPECT_EQ(result.text, input);
}

TEST(Sanitizer, ExtraTriggersExtendQuoting)
{
    SanitizerOptions options;
    options.extraNodeTriggers = "#";
    const std::string input = "flowchart TD\n    A[Issue #4] --> B[Done]";

    EXPECT_FALSE(sanitize(input).fixed());
    SanitizeResult result = sanitize(input, options);
    EXPECT_TRUE(result.fixed());
    EXPECT_EQ(result.text, "flowchart TD\n    A[\"Issue #4\"] --> B[Done]");
}

TEST(Sanitizer, SecondRunIsAlwaysUnchanged)
{
    for (const auto &input : brokenCorpus())
    {
        SanitizeResult first = sanitize(input);
        ASSERT_TRUE(first.fixed()) << input;
        SanitizeResult second = sanitize(first.text);
        EXPECT_EQ(second.status, SanitizeStatus::Unchanged) << first.text;
        EXPECT_EQ(second.text, first.text);
    }
}

TEST(Sanitizer, ConcurrentCallsAgree)
{
    const auto &corpus = brokenCorpus();
    std::vector<std::string> expected;
    for (const auto &input : corpus)
        expected.push_back(sanitize(input).text);

    std::vector<std::vector<std::string>> outputs(4);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < outputs.size(); ++t)
    {
        workers.emplace_back([&, t]() {
            for (const auto &input : corpus)
                outputs[t].push_back(sanitize(input).text);
        });
    }
    for (auto &worker : workers)
        worker.join();

    for (const auto &output : outputs)
        EXPECT_EQ(output, expected);
}

TEST(Sanitizer, DetectChangesComparesBytes)
{
    SanitizeResult same = mm::repair::detectChanges("flowchart TD\n", "flowchart TD\n",
                                                    {RepairRecord{RepairRule::SpecialCharQuoter, 1}});
    EXPECT_EQ(same.status, SanitizeStatus::Unchanged);
    EXPECT_TRUE(same.repairs.empty());

    SanitizeResult changed = mm::repair::detectChanges("flowchart TD\n", "flowchart TD\r\n", {});
    EXPECT_EQ(changed.status, SanitizeStatus::Fixed);
    EXPECT_EQ(changed.text, "flowchart TD\r\n");
}

TEST(Sanitizer, NamesRulesAndStatuses)
{
    EXPECT_EQ(mm::repair::ruleName(RepairRule::EscapeNormalizer), "escape_normalizer");
    EXPECT_EQ(mm::repair::ruleName(RepairRule::NestedQuoteResolver), "nested_quote_resolver");
    EXPECT_EQ(mm::repair::ruleName(RepairRule::EmptyEdgeLabel), "empty_edge_label");
    EXPECT_EQ(mm::repair::ruleName(RepairRule::SpecialCharQuoter), "special_char_quoter");
    EXPECT_EQ(mm::repair::ruleName(RepairRule::TrailingPunctuation), "trailing_punctuation");
    EXPECT_EQ(mm::repair::statusName(SanitizeStatus::Fixed), "fixed");
    EXPECT_EQ(mm::repair::statusName(SanitizeStatus::Unchanged), "unchanged");
}
