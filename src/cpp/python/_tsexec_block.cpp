#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/vector.h>

#include <tsexec/block/column_block.h>

namespace nb = nanobind;
using namespace nb::literals;

namespace {
    using namespace tsexec;

    Tags tags_from_pairs(const std::vector<std::pair<std::string, std::string>> &pairs) {
        Tags tags;
        for (const auto &[name, value]: pairs) { tags.add(name, value); }
        return tags;
    }

    std::vector<std::pair<std::string, std::string>> tags_to_pairs(const Tags &tags) {
        std::vector<std::pair<std::string, std::string>> pairs;
        pairs.reserve(tags.size());
        for (const auto &tag: tags) { pairs.emplace_back(tag.name, tag.value); }
        return pairs;
    }
} // namespace

void export_block(nb::module_ &m) {
    using namespace tsexec;

    nb::class_<Tags>(m, "Tags")
            .def(nb::init<>())
            .def("__init__", [](Tags *self, const std::vector<std::pair<std::string, std::string>> &pairs) {
                new (self) Tags(tags_from_pairs(pairs));
            }, "pairs"_a)
            .def("add", [](Tags &self, std::string name, std::string value) -> Tags & {
                return self.add(std::move(name), std::move(value));
            }, "name"_a, "value"_a, nb::rv_policy::reference_internal)
            .def("get", [](const Tags &self, const std::string &name) -> std::optional<std::string> {
                auto value = self.get(name);
                if (value) { return std::string{*value}; }
                return std::nullopt;
            }, "name"_a)
            .def("__contains__", [](const Tags &self, const std::string &name) { return self.contains(name); })
            .def("__len__", &Tags::size)
            .def("tags_with_keys", &Tags::tags_with_keys, "names"_a)
            .def("tags_without_keys", &Tags::tags_without_keys, "names"_a)
            .def_prop_ro("id", &Tags::id)
            .def("to_list", &tags_to_pairs)
            .def(nb::self == nb::self)
            .def("__str__", &Tags::to_string)
            .def("__repr__", &Tags::to_string);

    nb::class_<Bounds>(m, "Bounds")
            .def("__init__", [](Bounds *self, int64_t start_us, int64_t duration_us, int64_t step_size_us) {
                new (self) Bounds{
                    engine_time_t{engine_time_delta_t{start_us}},
                    engine_time_delta_t{duration_us},
                    engine_time_delta_t{step_size_us}
                };
            }, "start_us"_a, "duration_us"_a, "step_size_us"_a)
            .def_prop_ro("start_us", [](const Bounds &self) { return to_micros(self.start); })
            .def_prop_ro("duration_us", [](const Bounds &self) { return to_micros(self.duration); })
            .def_prop_ro("step_size_us", [](const Bounds &self) { return to_micros(self.step_size); })
            .def_prop_ro("steps", &Bounds::steps)
            .def("time_for_index_us", [](const Bounds &self, size_t index) {
                return to_micros(self.time_for_index(index));
            }, "index"_a)
            .def(nb::self == nb::self)
            .def("__repr__", &Bounds::to_string);

    nb::class_<BlockMeta>(m, "BlockMeta")
            .def("__init__", [](BlockMeta *self, Bounds bounds, Tags tags) {
                new (self) BlockMeta{bounds, std::move(tags)};
            }, "bounds"_a, "tags"_a = Tags{})
            .def_ro("bounds", &BlockMeta::bounds)
            .def_ro("tags", &BlockMeta::tags);

    nb::class_<SeriesMeta>(m, "SeriesMeta")
            .def("__init__", [](SeriesMeta *self, std::string name, Tags tags) {
                new (self) SeriesMeta{std::move(name), std::move(tags)};
            }, "name"_a, "tags"_a)
            .def_ro("name", &SeriesMeta::name)
            .def_ro("tags", &SeriesMeta::tags)
            .def(nb::self == nb::self);

    nb::class_<Block>(m, "Block");

    nb::class_<ColumnBlock, Block>(m, "ColumnBlock")
            .def_prop_ro("meta", &ColumnBlock::meta)
            .def_prop_ro("series_metas", &ColumnBlock::series_metas)
            .def_prop_ro("columns", &ColumnBlock::columns)
            .def_prop_ro("step_count", &ColumnBlock::step_count);

    m.def("make_column_block", [](BlockMeta meta, std::vector<SeriesMeta> series_metas,
                                  const std::vector<std::vector<double>> &columns) {
              return std::static_pointer_cast<ColumnBlock>(
                  make_column_block(std::move(meta), std::move(series_metas), columns));
          }, "meta"_a, "series_metas"_a, "columns"_a,
          "Build a block from one list of values per step, each holding a value per series.");
}
