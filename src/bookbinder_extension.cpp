#define DUCKDB_EXTENSION_MAIN

#include "bookbinder_extension.hpp"
#include "bookbinder_assembler.hpp"
#include "bookbinder_files.hpp"
#include "bookbinder_headings.hpp"
#include "bookbinder_wikilinks.hpp"
#include "bookbinder_word_count.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/types/vector.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/extension_helper.hpp"

namespace duckdb {

static string GetRootParameter(TableFunctionBindInput &input) {
	auto it = input.named_parameters.find("root");
	if (it != input.named_parameters.end() && !it->second.IsNull()) {
		return it->second.GetValue<string>();
	}
	return ".";
}

static string GetTargetArgument(TableFunctionBindInput &input, const char *function_name) {
	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("%s requires a file or folder argument", function_name);
	}
	return input.inputs[0].GetValue<string>();
}

//===--------------------------------------------------------------------===//
// bookbinder_bind table function
//===--------------------------------------------------------------------===//

struct BookbinderBindData : public TableFunctionData {
	bookbinder::BindResult result;
};

struct BookbinderBindState : public GlobalTableFunctionState {
	bool finished = false;
};

static unique_ptr<FunctionData> BookbinderBindBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	string target = GetTargetArgument(input, "bookbinder_bind");
	string root = GetRootParameter(input);

	bookbinder::BindOptions options;
	auto it = input.named_parameters.find("final");
	if (it != input.named_parameters.end() && !it->second.IsNull() && BooleanValue::Get(it->second)) {
		options.mode = bookbinder::OutputMode::FINAL;
	}

	// bound once here so a missing target or empty folder fails the query at bind time
	auto result = make_uniq<BookbinderBindData>();
	auto &fs = FileSystem::GetFileSystem(context);
	result->result = bookbinder::BindBook(fs, root, target, options);

	return_types.emplace_back(LogicalType::BIGINT);
	names.emplace_back("word_count");
	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("output");

	return std::move(result);
}

static unique_ptr<GlobalTableFunctionState> BookbinderBindInit(ClientContext &context,
                                                               TableFunctionInitInput &input) {
	return make_uniq<BookbinderBindState>();
}

static void BookbinderBindFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<BookbinderBindData>();
	auto &state = data_p.global_state->Cast<BookbinderBindState>();
	if (state.finished) {
		output.SetCardinality(0);
		return;
	}
	output.SetValue(0, 0, Value::BIGINT(NumericCast<int64_t>(bind_data.result.word_count)));
	output.SetValue(1, 0, Value(bind_data.result.output));
	output.SetCardinality(1);
	state.finished = true;
}

//===--------------------------------------------------------------------===//
// bookbinder_items table function
//===--------------------------------------------------------------------===//

struct BookbinderItemRow {
	string filename;
	string heading;
	string item;
	string link_target; // empty = plain item
};

struct BookbinderItemsData : public TableFunctionData {
	vector<BookbinderItemRow> rows;
};

struct BookbinderItemsState : public GlobalTableFunctionState {
	idx_t position = 0;
};

static unique_ptr<FunctionData> BookbinderItemsBind(ClientContext &context, TableFunctionBindInput &input,
                                                    vector<LogicalType> &return_types, vector<string> &names) {
	string target = GetTargetArgument(input, "bookbinder_items");
	string root = GetRootParameter(input);

	auto result = make_uniq<BookbinderItemsData>();
	auto &fs = FileSystem::GetFileSystem(context);
	for (const auto &path : bookbinder::ResolveSourceFiles(fs, root, target, true)) {
		string filename = FileSystem::ExtractName(path);
		for (const auto &section : bookbinder::SegmentHeadingsFile(fs, path)) {
			for (const auto &item : section.items) {
				auto classified = bookbinder::ClassifyItem(item);
				BookbinderItemRow row;
				row.filename = filename;
				row.heading = section.title;
				row.item = std::move(classified.text);
				row.link_target = std::move(classified.target);
				result->rows.push_back(std::move(row));
			}
		}
	}

	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("filename");
	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("heading");
	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("item");
	return_types.emplace_back(LogicalType::VARCHAR);
	names.emplace_back("link_target");

	return std::move(result);
}

static unique_ptr<GlobalTableFunctionState> BookbinderItemsInit(ClientContext &context,
                                                                TableFunctionInitInput &input) {
	return make_uniq<BookbinderItemsState>();
}

static void BookbinderItemsFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<BookbinderItemsData>();
	auto &state = data_p.global_state->Cast<BookbinderItemsState>();

	idx_t batch_start = state.position;
	idx_t batch_end = MinValue<idx_t>(batch_start + STANDARD_VECTOR_SIZE, bind_data.rows.size());
	state.position = batch_end;

	// Write directly to flat vector buffers instead of going through Value boxing.
	auto filename_data = FlatVector::GetData<string_t>(output.data[0]);
	auto heading_data = FlatVector::GetData<string_t>(output.data[1]);
	auto item_data = FlatVector::GetData<string_t>(output.data[2]);
	auto target_data = FlatVector::GetData<string_t>(output.data[3]);
	auto &target_validity = FlatVector::Validity(output.data[3]);

	idx_t count = 0;
	for (idx_t i = batch_start; i < batch_end; i++) {
		const auto &row = bind_data.rows[i];
		filename_data[count] = StringVector::AddString(output.data[0], row.filename);
		heading_data[count] = StringVector::AddString(output.data[1], row.heading);
		item_data[count] = StringVector::AddString(output.data[2], row.item);
		if (row.link_target.empty()) {
			target_validity.SetInvalid(count);
		} else {
			target_data[count] = StringVector::AddString(output.data[3], row.link_target);
		}
		count++;
	}
	output.SetCardinality(count);
}

static unique_ptr<NodeStatistics> BookbinderItemsCardinality(ClientContext &context, const FunctionData *bind_data) {
	auto &data = bind_data->Cast<BookbinderItemsData>();
	idx_t n = data.rows.size();
	return make_uniq<NodeStatistics>(n, n);
}

//===--------------------------------------------------------------------===//
// bookbinder_word_count scalar function
//===--------------------------------------------------------------------===//

static void BookbinderWordCountFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, int64_t>(args.data[0], result, args.size(), [&](string_t text) {
		return NumericCast<int64_t>(bookbinder::CountWords(text.GetString()));
	});
}

static void LoadInternal(ExtensionLoader &loader) {
	TableFunction bind_function("bookbinder_bind", {LogicalType::VARCHAR}, BookbinderBindFunction,
	                            BookbinderBindBind, BookbinderBindInit);
	bind_function.named_parameters["root"] = LogicalType::VARCHAR;
	bind_function.named_parameters["final"] = LogicalType::BOOLEAN;
	loader.RegisterFunction(bind_function);

	TableFunction items_function("bookbinder_items", {LogicalType::VARCHAR}, BookbinderItemsFunction,
	                             BookbinderItemsBind, BookbinderItemsInit);
	items_function.named_parameters["root"] = LogicalType::VARCHAR;
	items_function.cardinality = BookbinderItemsCardinality;
	loader.RegisterFunction(items_function);

	ScalarFunction word_count_function("bookbinder_word_count", {LogicalType::VARCHAR}, LogicalType::BIGINT,
	                                   BookbinderWordCountFunction);
	loader.RegisterFunction(word_count_function);
}

void BookbinderExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string BookbinderExtension::Name() {
	return "bookbinder";
}

std::string BookbinderExtension::Version() const {
#ifdef EXT_VERSION_BOOKBINDER
	return EXT_VERSION_BOOKBINDER;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(bookbinder, loader) {
	duckdb::LoadInternal(loader);
}
}
