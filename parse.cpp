#include "parse.hpp"

#include <sstream>
#include <iterator>

#include <boost/spirit/include/qi.hpp>
#include <boost/phoenix/operator.hpp>
#include <boost/phoenix/bind/bind_function.hpp>


template<class Iterator>
static std::string error_report(Iterator first, Iterator last, Iterator err) {

  Iterator line_start = first;
  unsigned line = 1;

  Iterator curr;
  for(curr = first; curr != err; ++curr) {
	if(*curr == '\n') {
	  line_start = curr;
	  ++line_start;
	  ++line;
	}
  }

  for(;curr != last; ++curr) {
	if( *curr == '\n') break;
  }

  Iterator line_end = curr;

  std::stringstream ss;

  ss << "on line " << line << ", column " << (std::distance(line_start, err) + 1) << ": ";

  for(curr = line_start; curr != line_end; ++curr) {
	ss << *curr;
  }

  if( err == last ) ss << " (end of input)";

  return ss.str();
}


// semantic actions
static ast::expr integer(ast::integer value) {
  return ast::lit<ast::integer>{ value };
}

static ast::expr boolean(bool value) {
  return ast::lit<bool>{ value };
}

static ast::expr variable(const std::string& name) {
  return ast::var( name );
}

static ast::expr definition(const std::string& name, const ast::expr& value, const ast::expr& body) {
  return ast::make_let( ast::var(name), value, body );
}


template<class Iterator>
static ast::expr parse(Iterator first, Iterator last) {
  namespace qi = boost::spirit::qi;
  namespace phx = boost::phoenix;

  using qi::_val;
  using qi::_1;
  using qi::_2;
  using qi::_3;

  using ast::unary;
  using ast::binary;

  // whitespace and comments
  qi::rule<Iterator> line_comment, block_comment, skip;

  line_comment = qi::lit("--") >> *(qi::char_ - qi::eol) >> (qi::eol | qi::eoi);
  block_comment = qi::lit("(*") >> *(qi::char_ - qi::lit("*)")) >> qi::lit("*)");
  skip = qi::space | line_comment | block_comment;

  using skip_type = qi::rule<Iterator>;

  // lexemes
  qi::rule<Iterator> word_end, keyword,
	kw_let, kw_in, kw_end, kw_if, kw_then, kw_else,
	kw_and, kw_or, kw_not, kw_true, kw_false, kw_div, kw_mod;

  word_end = !(qi::alnum | qi::char_('_'));

  kw_let = qi::lit("let") >> word_end;
  kw_in = qi::lit("in") >> word_end;
  kw_end = qi::lit("end") >> word_end;
  kw_if = qi::lit("if") >> word_end;
  kw_then = qi::lit("then") >> word_end;
  kw_else = qi::lit("else") >> word_end;
  kw_and = qi::lit("and") >> word_end;
  kw_or = qi::lit("or") >> word_end;
  kw_not = qi::lit("not") >> word_end;
  kw_true = qi::lit("true") >> word_end;
  kw_false = qi::lit("false") >> word_end;
  kw_div = qi::lit("div") >> word_end;
  kw_mod = qi::lit("mod") >> word_end;

  keyword = kw_let | kw_in | kw_end | kw_if | kw_then | kw_else
	| kw_and | kw_or | kw_not | kw_true | kw_false | kw_div | kw_mod;

  qi::rule<Iterator, std::string()> identifier;
  identifier = !keyword >> (qi::alpha | qi::char_('_')) >> *(qi::alnum | qi::char_('_'));

  // 0x1f, 0b101, 017, 42. overflowing 64 bits is a parse error
  qi::uint_parser<ast::integer, 16> hex;
  qi::uint_parser<ast::integer, 8> oct;
  qi::uint_parser<ast::integer, 2> bin;
  qi::uint_parser<ast::integer, 10> dec;

  qi::rule<Iterator, ast::integer()> number;
  number = ( (qi::no_case["0x"] >> hex)
			 | (qi::no_case["0b"] >> bin)
			 | (qi::lit('0') >> oct)
			 | dec ) >> word_end;

  // expressions, loosest binding first
  qi::rule<Iterator, ast::expr(), skip_type> start, expr, if_expr, or_expr, and_expr,
	eq_expr, cmp_expr, add_expr, mul_expr, unary_expr, let_expr, primary;

  expr = if_expr[_val = _1] | or_expr[_val = _1];

  if_expr = (kw_if > expr > kw_then > expr > kw_else > expr)
	[_val = phx::bind(&ast::make_cond, _1, _2, _3)];

  or_expr = and_expr[_val = _1]
	>> *( kw_or >> and_expr[_val = phx::bind(&ast::make_binary, binary::or_, _val, _1)] );

  and_expr = eq_expr[_val = _1]
	>> *( kw_and >> eq_expr[_val = phx::bind(&ast::make_binary, binary::and_, _val, _1)] );

  eq_expr = cmp_expr[_val = _1]
	>> *( (qi::lit("==") | '=')
		  >> cmp_expr[_val = phx::bind(&ast::make_binary, binary::eql, _val, _1)] );

  cmp_expr = add_expr[_val = _1]
	>> *( ("<=" >> add_expr[_val = phx::bind(&ast::make_binary, binary::le, _val, _1)])
		  | (">=" >> add_expr[_val = phx::bind(&ast::make_binary, binary::ge, _val, _1)])
		  | ('<' >> add_expr[_val = phx::bind(&ast::make_binary, binary::lt, _val, _1)])
		  | ('>' >> add_expr[_val = phx::bind(&ast::make_binary, binary::gt, _val, _1)]) );

  add_expr = mul_expr[_val = _1]
	>> *( ('+' >> mul_expr[_val = phx::bind(&ast::make_binary, binary::add, _val, _1)])
		  | ('-' >> mul_expr[_val = phx::bind(&ast::make_binary, binary::sub, _val, _1)]) );

  mul_expr = unary_expr[_val = _1]
	>> *( ('*' >> unary_expr[_val = phx::bind(&ast::make_binary, binary::mul, _val, _1)])
		  | ('/' >> unary_expr[_val = phx::bind(&ast::make_binary, binary::div, _val, _1)])
		  | (kw_div >> unary_expr[_val = phx::bind(&ast::make_binary, binary::div, _val, _1)])
		  | (kw_mod >> unary_expr[_val = phx::bind(&ast::make_binary, binary::mod, _val, _1)]) );

  unary_expr = ('~' >> unary_expr[_val = phx::bind(&ast::make_unary, unary::neg, _1)])
	| (kw_not >> unary_expr[_val = phx::bind(&ast::make_unary, unary::not_, _1)])
	| let_expr[_val = _1]
	| primary[_val = _1];

  let_expr = (kw_let > identifier > "<-" > expr > kw_in > expr > kw_end)
	[_val = phx::bind(&definition, _1, _2, _3)];

  primary = ('(' > expr > ')')[_val = _1]
	| number[_val = phx::bind(&integer, _1)]
	| kw_true[_val = phx::bind(&boolean, true)]
	| kw_false[_val = phx::bind(&boolean, false)]
	| identifier[_val = phx::bind(&variable, _1)];

  // a stray 'end' may close a toplevel conditional
  start = expr[_val = _1] >> -kw_end;

  ast::expr res;
  Iterator it = first;

  bool ok = false;
  try {
	ok = qi::phrase_parse(it, last, start, skip, res);
  } catch( qi::expectation_failure<Iterator>& e ) {
	std::stringstream ss;
	ss << "expected " << e.what_ << " " << error_report(first, last, e.first);
	throw parse_error( ss.str() );
  }

  if( !ok || it != last ) {
	throw parse_error( "unexpected input " + error_report(first, last, it) );
  }

  return res;
}


ast::expr parse(const std::string& text) {
  return parse(text.begin(), text.end());
}


ast::expr parse(std::istream& in) {
  const std::string text( (std::istreambuf_iterator<char>(in)),
						  std::istreambuf_iterator<char>() );
  return parse(text);
}
