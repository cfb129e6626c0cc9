/**
 * ==========================================================================
 * SpNDA: Sparse matrices for nda
 *
 * Copyright (c) 2024-2025 The SpNDA developer team
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 * 
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 * ==========================================================================
 */


#undef NDEBUG

#include <complex>
#include <filesystem>
#include <fstream>
#include <string>

#include "catch2/catch.hpp"

#include "configuration.hpp"
#include "utilities/test_common.hpp"
#include "IO/ptree/InputParser.hpp"
#include "IO/ptree/ptree_utilities.hpp"
#include "IO/triplet_io.hpp"

namespace spnda_tests
{

namespace fs = std::filesystem;

// file in the system temporary directory, removed at scope exit
struct scratch_file
{
  fs::path path;
  explicit scratch_file(std::string const& name, std::string const& contents = "") :
    path(fs::temp_directory_path() / ("spnda_" + std::to_string(utils::test_seed()) + "_" + name))
  {
    std::ofstream f(path);
    f << contents;
  }
  ~scratch_file() { std::error_code ec; fs::remove(path, ec); }
  std::string str() const { return path.string(); }
};

TEST_CASE("input_formats", "[io][input]")
{
  std::string json = R"({"matrix": {"name": "A", "file": "a.txt", "format": "CSC", "base": 0}})";
  InputParser pj(json);
  auto const& mj = pj.get_root().get_child("matrix");
  REQUIRE(io::get_value<std::string>(mj, "name") == "A");
  REQUIRE(io::get_value<int>(mj, "base") == 0);
  REQUIRE(io::get_option(mj, "format", "csr", {"csr", "csc", "coo"}) == "csc");

  InputParser px;
  px.parse(std::string("<spnda><matrix name=\"A\" file=\"a.txt\"/></spnda>"), "xml");
  auto const& mx = px.get_root().get_child("matrix");
  REQUIRE(io::get_value<std::string>(mx, "name") == "A");
  REQUIRE(io::get_value<std::string>(mx, "file") == "a.txt");

  InputParser pt;
  pt.parse(std::string("[matrix]\nname = \"A\"\nfile = \"a.txt\"\nbase = 1\n"), "toml");
  auto const& mt = pt.get_root().get_child("matrix");
  REQUIRE(io::get_value<std::string>(mt, "name") == "A");
  REQUIRE(io::get_value<int>(mt, "base") == 1);

  // toml arrays of tables are nameless children
  InputParser pa;
  pa.parse(std::string("[[solve]]\nmatrix = \"A\"\n[[solve]]\nmatrix = \"B\"\n"), "toml");
  auto const& sa = pa.get_root().get_child("solve");
  REQUIRE(sa.size() == 2);
  REQUIRE(sa.begin()->first == "");

  CHECK_THROWS_AS(InputParser().parse(std::string("a = 1"), "yaml"), utils::app_abort_error);
  CHECK_THROWS_AS(pt.parse(std::string("[matrix\n"), "toml"), utils::app_abort_error);

  scratch_file f("input.json", json);
  InputParser pf(f.str());
  REQUIRE(io::get_value<std::string>(pf.get_root(), "matrix.name") == "A");
  CHECK_THROWS_AS(InputParser("does_not_exist.json"), utils::app_abort_error);
}

TEST_CASE("ptree_utilities", "[io][input]")
{
  InputParser p(std::string(R"({"a": 3, "s": "Lu", "arr": [1, 2, 3], "b": {"c": 1.5}})"));
  auto const& pt = p.get_root();
  REQUIRE(io::get_value_with_default<int>(pt, "a", 7) == 3);
  REQUIRE(io::get_value_with_default<int>(pt, "z", 7) == 7);
  REQUIRE(io::get_value<double>(pt, "b.c") == 1.5);
  REQUIRE(io::get_option(pt, "s", "cholesky", {"cholesky", "lu"}) == "lu");
  REQUIRE(io::get_option(pt, "z", "cholesky", {"cholesky", "lu"}) == "cholesky");
  REQUIRE(pt.get_child("arr").size() == 3);

  CHECK_THROWS_AS(io::get_value<int>(pt, "z"), utils::app_abort_error);
  CHECK_THROWS_AS(io::get_value<int>(pt, "s"), utils::app_abort_error);
  CHECK_THROWS_AS(io::get_option(pt, "s", "cholesky", {"cholesky", "qr"}), utils::app_abort_error);
  CHECK_THROWS_AS(io::get_value<double>(pt, "b"), utils::app_abort_error);

  REQUIRE(io::get_file_extension("dir/input.TOML") == "toml");
  REQUIRE(io::get_file_extension("input") == "");
  REQUIRE(io::tolower_copy("Cholesky") == "cholesky");
}

TEST_CASE("triplet_io", "[io][triplets]")
{
  {
    scratch_file f("a.txt", "1 1 2.0\n3 2 -1.5\n1 1 1.0\n2 4 0.5\n");
    auto coo = io::read_triplets<double>(f.str());
    REQUIRE(coo.nrows() == 3);
    REQUIRE(coo.ncols() == 4);
    REQUIRE(coo.nnz() == 4);
    auto A = math::sparse::to_dense(coo);
    REQUIRE(A(0,0) == 3.0);
    REQUIRE(A(2,1) == -1.5);
    REQUIRE(A(1,3) == 0.5);

    // explicit shape, 0-based
    auto c0 = io::read_triplets<double>(f.str(), 0, 5, 6);
    REQUIRE(c0.shape() == std::array<long,2>{5,6});
    REQUIRE(math::sparse::to_dense(c0)(1,1) == 3.0);

    CHECK_THROWS_AS(io::read_triplets<double>(f.str(), 1, 2, 4), math::sparse::sparse_format_error);
  }
  {
    scratch_file f("bad.txt", "1 1 2.0\n0 2 1.0\n");
    CHECK_THROWS_AS(io::read_triplets<double>(f.str()), utils::app_abort_error);
  }
  {
    // does not fit an int index
    scratch_file f("large.txt", "1 1 2.0\n3000000000 2 1.0\n");
    try {
      io::read_triplets<double,int>(f.str());
      FAIL("an index beyond the index type must throw");
    } catch(math::sparse::sparse_format_error const& e) {
      REQUIRE(e.kind() == math::sparse::sparse_format_error_kind::index_out_of_bounds);
    }
    auto coo = io::read_triplets<double,long>(f.str(), 1, 3000000000L, 2);
    REQUIRE(coo.nnz() == 2);
  }
  {
    scratch_file f("malformed.txt", "1 1 2.0\n2 x 1.0\n");
    CHECK_THROWS_AS(io::read_triplets<double>(f.str()), utils::app_abort_error);
  }
  {
    scratch_file f("empty.txt", "");
    auto coo = io::read_triplets<double>(f.str(), 1, 2, 2);
    REQUIRE(coo.nnz() == 0);
    REQUIRE(coo.shape() == std::array<long,2>{2,2});
  }
  CHECK_THROWS_AS(io::read_triplets<double>("does_not_exist.txt"), utils::app_abort_error);
}

TEST_CASE("vector_io", "[io][triplets]")
{
  nda::array<double,1> v = {1.0, -2.5, 1.0/3.0, 1e-20};
  scratch_file f("v.txt");
  io::write_vector(v, f.str());
  auto w = io::read_vector<double>(f.str());
  utils::ARRAY_EQUAL(v, w, 1e-15, 1e-15);

  scratch_file c("vc.txt", "(1,2)\n(0.5,-1)\n");
  auto z = io::read_vector<std::complex<double>>(c.str());
  REQUIRE(z.extent(0) == 2);
  REQUIRE(z(1) == std::complex<double>(0.5, -1.0));

  scratch_file bad("vbad.txt", "1.0\nfoo\n");
  CHECK_THROWS_AS(io::read_vector<double>(bad.str()), utils::app_abort_error);
}

} // spnda_tests
